#include "photo_triage/config/configuration.hpp"
#include "photo_triage/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <thread>

namespace photo_triage::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["input"]) {
            auto in = node["input"];
            if (in["pattern"]) cfg.input.pattern = in["pattern"].as<std::string>();
        }

        if (node["clustering"]) {
            auto c = node["clustering"];
            if (c["engine"]) cfg.clustering.engine = c["engine"].as<std::string>();
            if (c["epsilon"]) cfg.clustering.epsilon = c["epsilon"].as<double>();
            if (c["min_samples"]) cfg.clustering.min_samples = c["min_samples"].as<int>();
            if (c["phash_max_distance"]) {
                cfg.clustering.phash_max_distance = c["phash_max_distance"].as<int>();
            }
        }

        if (node["embedding"]) {
            auto e = node["embedding"];
            if (e["model_path"]) cfg.embedding.model_path = e["model_path"].as<std::string>();
            if (e["model_version"]) cfg.embedding.model_version = e["model_version"].as<std::string>();
            if (e["input_size"]) cfg.embedding.input_size = e["input_size"].as<int>();
        }

        if (node["quality"]) {
            auto q = node["quality"];
            if (q["scorer"]) cfg.quality.scorer = q["scorer"].as<std::string>();
            if (q["keeper_threshold"]) cfg.quality.keeper_threshold = q["keeper_threshold"].as<double>();
            if (q["ambiguous_threshold"]) {
                cfg.quality.ambiguous_threshold = q["ambiguous_threshold"].as<double>();
            }
            if (q["brisque_model_path"]) {
                cfg.quality.brisque_model_path = q["brisque_model_path"].as<std::string>();
            }
            if (q["brisque_range_path"]) {
                cfg.quality.brisque_range_path = q["brisque_range_path"].as<std::string>();
            }
            if (q["max_dimension"]) cfg.quality.max_dimension = q["max_dimension"].as<int>();
            if (q["laplacian_patch_size"]) {
                cfg.quality.laplacian_patch_size = q["laplacian_patch_size"].as<int>();
            }
            if (q["laplacian_reference"]) {
                cfg.quality.laplacian_reference = q["laplacian_reference"].as<float>();
            }
        }

        if (node["escalation"]) {
            auto e = node["escalation"];
            if (e["enabled"]) cfg.escalation.enabled = e["enabled"].as<bool>();
            if (e["endpoint"]) cfg.escalation.endpoint = e["endpoint"].as<std::string>();
            if (e["model"]) cfg.escalation.model = e["model"].as<std::string>();
            if (e["timeout_seconds"]) cfg.escalation.timeout_seconds = e["timeout_seconds"].as<int>();
            if (e["concurrency"]) cfg.escalation.concurrency = e["concurrency"].as<int>();
        }

        if (node["cache"]) {
            auto c = node["cache"];
            if (c["enabled"]) cfg.cache.enabled = c["enabled"].as<bool>();
            if (c["required"]) cfg.cache.required = c["required"].as<bool>();
            if (c["location"]) cfg.cache.location = c["location"].as<std::string>();
            if (c["entry_max_age_days"]) {
                cfg.cache.entry_max_age_days = c["entry_max_age_days"].as<float>();
            }
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["worker_count"]) cfg.runtime.worker_count = r["worker_count"].as<int>();
            if (r["dry_run"]) cfg.runtime.dry_run = r["dry_run"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["pattern"] = input.pattern;

    node["clustering"]["engine"] = clustering.engine;
    node["clustering"]["epsilon"] = clustering.epsilon;
    node["clustering"]["min_samples"] = clustering.min_samples;
    node["clustering"]["phash_max_distance"] = clustering.phash_max_distance;

    node["embedding"]["model_path"] = embedding.model_path;
    node["embedding"]["model_version"] = embedding.model_version;
    node["embedding"]["input_size"] = embedding.input_size;

    node["quality"]["scorer"] = quality.scorer;
    node["quality"]["keeper_threshold"] = quality.keeper_threshold;
    node["quality"]["ambiguous_threshold"] = quality.ambiguous_threshold;
    node["quality"]["brisque_model_path"] = quality.brisque_model_path;
    node["quality"]["brisque_range_path"] = quality.brisque_range_path;
    node["quality"]["max_dimension"] = quality.max_dimension;
    node["quality"]["laplacian_patch_size"] = quality.laplacian_patch_size;
    node["quality"]["laplacian_reference"] = quality.laplacian_reference;

    node["escalation"]["enabled"] = escalation.enabled;
    node["escalation"]["endpoint"] = escalation.endpoint;
    node["escalation"]["model"] = escalation.model;
    node["escalation"]["timeout_seconds"] = escalation.timeout_seconds;
    node["escalation"]["concurrency"] = escalation.concurrency;

    node["cache"]["enabled"] = cache.enabled;
    node["cache"]["required"] = cache.required;
    node["cache"]["location"] = cache.location;
    node["cache"]["entry_max_age_days"] = cache.entry_max_age_days;

    node["runtime"]["worker_count"] = runtime.worker_count;
    node["runtime"]["dry_run"] = runtime.dry_run;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config: " + path.string());
    }
    out << to_yaml();
}

void Config::validate() const {
    if (input.pattern.empty()) {
        throw ValidationError("input.pattern must not be empty");
    }

    if (clustering.engine != "clip" && clustering.engine != "phash") {
        throw ValidationError("clustering.engine must be 'clip' or 'phash'");
    }
    if (!(clustering.epsilon > 0.0) || clustering.epsilon > 2.0) {
        throw ValidationError("clustering.epsilon must be in (0, 2]");
    }
    if (clustering.min_samples < 1) {
        throw ValidationError("clustering.min_samples must be >= 1");
    }
    if (clustering.phash_max_distance < 0 || clustering.phash_max_distance > 64) {
        throw ValidationError("clustering.phash_max_distance must be in [0, 64]");
    }
    if (clustering.engine == "clip" && embedding.model_path.empty()) {
        throw ValidationError("embedding.model_path is required for clustering.engine 'clip'");
    }
    if (embedding.input_size < 32) {
        throw ValidationError("embedding.input_size must be >= 32");
    }
    if (embedding.model_version.empty()) {
        throw ValidationError("embedding.model_version must not be empty");
    }

    if (quality.scorer != "brisque" && quality.scorer != "laplacian") {
        throw ValidationError("quality.scorer must be 'brisque' or 'laplacian'");
    }
    if (!std::isfinite(quality.keeper_threshold) || !std::isfinite(quality.ambiguous_threshold)) {
        throw ValidationError("quality thresholds must be finite");
    }
    if (quality.keeper_threshold > quality.ambiguous_threshold) {
        throw ValidationError("quality.keeper_threshold must be <= quality.ambiguous_threshold");
    }
    if (quality.max_dimension < 64) {
        throw ValidationError("quality.max_dimension must be >= 64");
    }
    if (quality.laplacian_patch_size < 8) {
        throw ValidationError("quality.laplacian_patch_size must be >= 8");
    }
    if (!(quality.laplacian_reference > 0.0f)) {
        throw ValidationError("quality.laplacian_reference must be > 0");
    }

    if (escalation.enabled && escalation.endpoint.empty()) {
        throw ValidationError("escalation.endpoint must not be empty when escalation is enabled");
    }
    if (escalation.enabled && escalation.model.empty()) {
        throw ValidationError("escalation.model must not be empty when escalation is enabled");
    }
    if (escalation.timeout_seconds < 1) {
        throw ValidationError("escalation.timeout_seconds must be >= 1");
    }
    if (escalation.concurrency < 1) {
        throw ValidationError("escalation.concurrency must be >= 1");
    }
    if (runtime.worker_count < 0) {
        throw ValidationError("runtime.worker_count must be >= 0");
    }
    if (runtime.worker_count > 0 && escalation.concurrency > runtime.worker_count) {
        throw ValidationError("escalation.concurrency must be <= runtime.worker_count");
    }

    if (cache.enabled && cache.location.empty()) {
        throw ValidationError("cache.location must not be empty when the cache is enabled");
    }
    if (cache.required && !cache.enabled) {
        throw ValidationError("cache.required needs cache.enabled");
    }
    if (cache.entry_max_age_days < 0.0f) {
        throw ValidationError("cache.entry_max_age_days must be >= 0");
    }
}

void Config::override_worker_count(int workers) {
    if (workers < 1) {
        return;
    }
    runtime.worker_count = workers;
    escalation.concurrency = std::min(escalation.concurrency, workers);
}

int Config::effective_worker_count() const {
    int workers = runtime.worker_count;
    if (workers < 1) {
        workers = static_cast<int>(std::thread::hardware_concurrency());
    }
    return std::max(1, workers);
}

int Config::effective_escalation_concurrency() const {
    return std::max(1, std::min(escalation.concurrency, effective_worker_count()));
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "input": {
      "type": "object",
      "properties": {
        "pattern": {"type": "string"}
      }
    },
    "clustering": {
      "type": "object",
      "properties": {
        "engine": {"type": "string", "enum": ["clip", "phash"]},
        "epsilon": {"type": "number", "exclusiveMinimum": 0, "maximum": 2},
        "min_samples": {"type": "integer", "minimum": 1},
        "phash_max_distance": {"type": "integer", "minimum": 0, "maximum": 64}
      }
    },
    "embedding": {
      "type": "object",
      "properties": {
        "model_path": {"type": "string"},
        "model_version": {"type": "string"},
        "input_size": {"type": "integer", "minimum": 32}
      }
    },
    "quality": {
      "type": "object",
      "properties": {
        "scorer": {"type": "string", "enum": ["brisque", "laplacian"]},
        "keeper_threshold": {"type": "number"},
        "ambiguous_threshold": {"type": "number"},
        "brisque_model_path": {"type": "string"},
        "brisque_range_path": {"type": "string"},
        "max_dimension": {"type": "integer", "minimum": 64},
        "laplacian_patch_size": {"type": "integer", "minimum": 8},
        "laplacian_reference": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "escalation": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "endpoint": {"type": "string"},
        "model": {"type": "string"},
        "timeout_seconds": {"type": "integer", "minimum": 1},
        "concurrency": {"type": "integer", "minimum": 1}
      }
    },
    "cache": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "required": {"type": "boolean"},
        "location": {"type": "string"},
        "entry_max_age_days": {"type": "number", "minimum": 0}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "worker_count": {"type": "integer", "minimum": 0},
        "dry_run": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace photo_triage::config
