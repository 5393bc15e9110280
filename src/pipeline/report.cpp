#include "photo_triage/pipeline/report.hpp"
#include "photo_triage/core/utils.hpp"

#include <iomanip>
#include <sstream>

namespace photo_triage::pipeline {

namespace {

using json = nlohmann::json;

json failure_to_json(const FailureRecord& f) {
    return {
        {"path", f.path.string()},
        {"fingerprint", f.fingerprint.empty() ? json(nullptr) : json(f.fingerprint)},
        {"stage", failure_stage_to_string(f.stage)},
        {"kind", f.kind},
        {"message", f.message}
    };
}

json stage2_to_json(const StructuredVerdict& v) {
    return {
        {"decision", stage2_decision_to_string(v.decision)},
        {"label", v.label},
        {"critique", v.critique ? json(*v.critique) : json(nullptr)}
    };
}

} // namespace

json report_to_json(const PipelineReport& report) {
    json j;
    j["run_id"] = report.run_id;
    j["dry_run"] = report.dry_run;
    j["strategies"] = {
        {"clustering", report.clustering_engine},
        {"embedding_version", report.embedding_version},
        {"quality_version", report.quality_version},
        {"cache_enabled", report.cache_enabled}
    };

    json bursts = json::array();
    for (const auto& b : report.bursts) {
        json members = json::array();
        for (const auto& p : b.paths) members.push_back(p.string());
        bursts.push_back({
            {"members", members},
            {"fingerprints", b.fingerprints},
            {"pick", b.pick_path.empty() ? json(nullptr) : json(b.pick_path.string())},
            {"pick_fingerprint", b.pick_fingerprint}
        });
    }
    j["bursts"] = bursts;

    json images = json::object();
    for (const auto& [key, ir] : report.images) {
        json e;
        e["fingerprint"] = ir.fingerprint.empty() ? json(nullptr) : json(ir.fingerprint);
        e["byte_size"] = ir.byte_size;
        e["decode_status"] = decode_status_to_string(ir.decode_status);
        e["burst"] = ir.burst_index ? json(*ir.burst_index) : json(nullptr);
        if (ir.verdict) {
            e["tier"] = verdict_tier_to_string(ir.verdict->tier);
            e["stage1_tier"] = stage1_tier_to_string(ir.verdict->stage1_tier);
            e["stage1_score"] = ir.verdict->stage1_score;
            e["needs_review"] = ir.verdict->needs_review;
            if (ir.verdict->stage2) {
                e["stage2"] = stage2_to_json(*ir.verdict->stage2);
            }
        } else {
            e["tier"] = nullptr;
            e["needs_review"] = true;
        }
        if (!ir.failures.empty()) {
            json fs_json = json::array();
            for (const auto& f : ir.failures) fs_json.push_back(failure_to_json(f));
            e["failures"] = fs_json;
        }
        images[key] = e;
    }
    j["images"] = images;

    json failures = json::array();
    for (const auto& f : report.failures) failures.push_back(failure_to_json(f));
    j["failures"] = failures;

    const auto& s = report.stats;
    j["stats"] = {
        {"images", s.images},
        {"unique_fingerprints", s.unique_fingerprints},
        {"embedding_cache_hits", s.embedding_cache_hits},
        {"embedding_cache_misses", s.embedding_cache_misses},
        {"quality_cache_hits", s.quality_cache_hits},
        {"quality_cache_misses", s.quality_cache_misses},
        {"embeddings_computed", s.embeddings_computed},
        {"scores_computed", s.scores_computed},
        {"escalations_issued", s.escalations_issued},
        {"escalations_failed", s.escalations_failed},
        {"cache_write_errors", s.cache_write_errors}
    };
    return j;
}

void write_report(const PipelineReport& report, const fs::path& path) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    core::write_text_atomic(path, report_to_json(report).dump(2) + "\n");
}

std::string format_preview(const PipelineReport& report) {
    std::ostringstream oss;
    oss << "Bursts (" << report.bursts.size() << "):\n";
    for (size_t i = 0; i < report.bursts.size(); ++i) {
        const auto& b = report.bursts[i];
        if (b.paths.size() < 2) continue;
        oss << "  #" << i << " " << b.paths.size() << " images, pick "
            << b.pick_path.filename().string() << "\n";
        for (const auto& p : b.paths) {
            oss << "    " << (p == b.pick_path ? "* " : "  ") << p.filename().string() << "\n";
        }
    }

    oss << "Verdicts:\n";
    for (const auto& [key, ir] : report.images) {
        oss << "  " << std::left << std::setw(20)
            << (ir.verdict ? verdict_tier_to_string(ir.verdict->tier) : std::string("unavailable"))
            << fs::path(key).filename().string();
        if (ir.verdict) {
            oss << "  (" << std::fixed << std::setprecision(1) << ir.verdict->stage1_score << ")";
            if (ir.verdict->stage2) {
                oss << " -> " << stage2_decision_to_string(ir.verdict->stage2->decision) << " '"
                    << ir.verdict->stage2->label << "'";
            }
        }
        oss << "\n";
    }

    if (!report.failures.empty()) {
        oss << "Failures (" << report.failures.size() << "):\n";
        for (const auto& f : report.failures) {
            oss << "  " << f.path.filename().string() << " [" << failure_stage_to_string(f.stage)
                << "] " << f.kind << ": " << f.message << "\n";
        }
    }
    return oss.str();
}

} // namespace photo_triage::pipeline
