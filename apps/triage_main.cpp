#include "photo_triage/config/configuration.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"
#include "photo_triage/pipeline/orchestrator.hpp"
#include "photo_triage/pipeline/report.hpp"
#include "photo_triage/pipeline/strategies.hpp"

#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using namespace photo_triage;

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

config::Config load_config_or_default(const std::string& config_path) {
    if (config_path.empty()) {
        return config::Config{};
    }
    return config::Config::load(config_path);
}

// Relative cache locations live next to the photos.
fs::path resolve_cache_location(const config::Config& cfg, const fs::path& input_dir) {
    fs::path loc(cfg.cache.location);
    if (loc.is_relative()) {
        loc = input_dir / loc;
    }
    return loc;
}

int run_command(const std::string& config_path, const std::string& input_dir_str,
                const std::string& report_path_str, bool dry_run, int workers) {
    const fs::path input_dir(input_dir_str);
    if (!fs::is_directory(input_dir)) {
        std::cerr << "Error: input directory not found: " << input_dir << std::endl;
        return 1;
    }

    config::Config cfg;
    try {
        cfg = load_config_or_default(config_path);
        if (dry_run) cfg.runtime.dry_run = true;
        cfg.override_worker_count(workers);
        cfg.cache.location = resolve_cache_location(cfg, input_dir).string();
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const fs::path report_path = report_path_str.empty()
                                     ? input_dir / "photo_triage_report.json"
                                     : fs::path(report_path_str);
    const fs::path events_path = report_path.parent_path().empty()
                                     ? fs::path("photo_triage_events.jsonl")
                                     : report_path.parent_path() / "photo_triage_events.jsonl";

    auto images = core::discover_images(input_dir, cfg.input.pattern);
    std::cout << "[SCAN] " << images.size() << " images in " << input_dir.string() << std::endl;
    if (images.empty()) {
        std::cerr << "Error: no images matching '" << cfg.input.pattern << "'" << std::endl;
        return 1;
    }

    pipeline::Strategies strategies;
    try {
        strategies = pipeline::make_strategies(cfg);
    } catch (const PhotoTriageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[SETUP] clustering=" << strategies.clustering->name()
              << " (" << strategies.extractor->producer_version() << ")"
              << ", quality=" << strategies.scorer->name()
              << ", stage2=" << (strategies.vlm ? strategies.vlm->describe() : std::string("off"))
              << ", workers=" << cfg.effective_worker_count() << std::endl;

    // a dry run writes nothing but the cache and the report
    std::ofstream event_log;
    if (!cfg.runtime.dry_run) {
        event_log.open(events_path, std::ios::out | std::ios::app);
        if (!event_log) {
            std::cerr << "Warning: cannot write events to " << events_path << std::endl;
        }
    }

    auto cache = pipeline::make_cache(cfg);

    pipeline::OrchestratorDeps deps;
    deps.cache = cache;
    deps.extractor = strategies.extractor;
    deps.clustering = strategies.clustering;
    deps.scorer = strategies.scorer;
    deps.vlm = strategies.vlm;
    deps.event_log = cfg.runtime.dry_run ? &std::clog
                                         : (event_log.is_open() ? &event_log : nullptr);

    const auto t0 = std::chrono::steady_clock::now();
    PipelineReport report;
    try {
        pipeline::Orchestrator orchestrator(deps);
        report = orchestrator.run(images, cfg);
    } catch (const PhotoTriageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    try {
        pipeline::write_report(report, report_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot write report: " << e.what() << std::endl;
        return 1;
    }

    if (cfg.cache.enabled && cfg.cache.entry_max_age_days > 0.0f && report.cache_enabled) {
        try {
            cache::DiskContentCache store(cfg.cache.location);
            store.open();
            const auto max_age = std::chrono::seconds(
                static_cast<int64_t>(cfg.cache.entry_max_age_days * 86400.0f));
            const size_t removed = store.prune(max_age);
            store.close();
            std::cout << "[CACHE] pruned " << removed << " stale entries" << std::endl;
        } catch (const CacheIOError& e) {
            std::cerr << "Warning: cache prune failed: " << e.what() << std::endl;
        }
    }

    if (report.dry_run) {
        std::cout << "\n[DRY RUN] No files are moved. Planned triage:\n"
                  << pipeline::format_preview(report) << std::endl;
    }

    const auto& s = report.stats;
    std::cout << "[DONE] " << s.images << " images, " << report.bursts.size() << " bursts, "
              << report.failures.size() << " failures in " << secs << "s" << std::endl;
    std::cout << "  cache: embedding " << s.embedding_cache_hits << " hit / "
              << s.embedding_cache_misses << " miss, quality " << s.quality_cache_hits
              << " hit / " << s.quality_cache_misses << " miss" << std::endl;
    std::cout << "  stage2: " << s.escalations_issued << " escalated, "
              << s.escalations_failed << " failed" << std::endl;
    std::cout << "  report: " << report_path.string() << std::endl;
    return 0;
}

int prune_command(const std::string& config_path, const std::string& input_dir, float max_age_days) {
    try {
        auto cfg = load_config_or_default(config_path);
        const fs::path base = input_dir.empty() ? fs::current_path() : fs::path(input_dir);
        const fs::path location = resolve_cache_location(cfg, base);
        const float days = max_age_days >= 0.0f ? max_age_days : cfg.cache.entry_max_age_days;

        cache::DiskContentCache store(location);
        store.open();
        const size_t removed =
            store.prune(std::chrono::seconds(static_cast<int64_t>(days * 86400.0f)));
        store.close();

        print_json({{"cache", location.string()}, {"max_age_days", days}, {"removed", removed}});
        return 0;
    } catch (const PhotoTriageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int validate_config_command(const std::string& path) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        auto cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
        result["effective_worker_count"] = cfg.effective_worker_count();
    } catch (const ConfigError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

int get_schema_command() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

int default_config_command() {
    std::cout << config::Config{}.to_yaml() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"photo_triage - burst grouping and quality triage"};
    app.require_subcommand(1);

    std::string config_path, input_dir, report_path;
    bool dry_run = false;
    int workers = 0;
    float max_age_days = -1.0f;

    auto run_cmd = app.add_subcommand("run", "Analyze a directory of photos");
    run_cmd->add_option("--config", config_path, "Path to config.yaml");
    run_cmd->add_option("--input-dir", input_dir, "Directory with the photos")->required();
    run_cmd->add_option("--report", report_path,
                        "Report path (default: <input-dir>/photo_triage_report.json)");
    run_cmd->add_option("--workers", workers, "Worker threads (0 = config / CPU cores)");
    run_cmd->add_flag("--dry-run", dry_run, "Preview the triage plan");

    auto prune_cmd = app.add_subcommand("prune-cache", "Remove stale cache entries");
    prune_cmd->add_option("--config", config_path, "Path to config.yaml");
    prune_cmd->add_option("--input-dir", input_dir, "Base directory of a relative cache location");
    prune_cmd->add_option("--max-age-days", max_age_days,
                          "Entry age threshold (default: cache.entry_max_age_days)");

    auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
    validate_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

    auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");
    auto defaults_cmd = app.add_subcommand("default-config", "Print the default config as YAML");

    CLI11_PARSE(app, argc, argv);

    int rc = 1;
    if (run_cmd->parsed()) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        rc = run_command(config_path, input_dir, report_path, dry_run, workers);
        curl_global_cleanup();
    } else if (prune_cmd->parsed()) {
        rc = prune_command(config_path, input_dir, max_age_days);
    } else if (validate_cmd->parsed()) {
        rc = validate_config_command(config_path);
    } else if (schema_cmd->parsed()) {
        rc = get_schema_command();
    } else if (defaults_cmd->parsed()) {
        rc = default_config_command();
    }
    return rc;
}
