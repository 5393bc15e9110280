#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace photo_triage::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string pattern = "*.jpg;*.jpeg;*.png;*.tif;*.tiff;*.webp;*.bmp";
};

struct ClusteringConfig {
  std::string engine = "clip";   // clip | phash
  double epsilon = 0.15;         // cosine distance
  int min_samples = 2;           // neighbors incl. the point itself
  int phash_max_distance = 8;    // hamming bits, phash engine only
};

struct EmbeddingConfig {
  std::string model_path;        // ONNX image encoder
  std::string model_version = "clip-vit-b-32";
  int input_size = 224;
};

struct QualityConfig {
  std::string scorer = "brisque"; // brisque | laplacian
  double keeper_threshold = 35.0;
  double ambiguous_threshold = 50.0;
  std::string brisque_model_path = "brisque_model_live.yml";
  std::string brisque_range_path = "brisque_range_live.yml";
  int max_dimension = 1024;
  int laplacian_patch_size = 256;
  float laplacian_reference = 40.0f;
};

struct EscalationConfig {
  bool enabled = true;
  std::string endpoint = "http://localhost:11434";
  std::string model = "openbmb/minicpm-v2.6:q4_K_M";
  int timeout_seconds = 60;
  int concurrency = 2;
};

struct CacheConfig {
  bool enabled = true;
  bool required = false;          // fail the run if the store cannot be opened
  std::string location = ".photo_triage_cache";
  float entry_max_age_days = 0.0f; // 0 = never prune
};

struct RuntimeConfig {
  int worker_count = 0;           // 0 = hardware concurrency
  bool dry_run = false;
};

struct Config {
  InputConfig input;
  ClusteringConfig clustering;
  EmbeddingConfig embedding;
  QualityConfig quality;
  EscalationConfig escalation;
  CacheConfig cache;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Command-line --workers: sets runtime.worker_count and lowers
  // escalation.concurrency to it when needed.
  void override_worker_count(int workers);

  // worker_count resolved against the machine (always >= 1)
  int effective_worker_count() const;
  int effective_escalation_concurrency() const;
};

std::string get_schema_json();

} // namespace photo_triage::config
