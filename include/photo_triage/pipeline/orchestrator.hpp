#pragma once

#include "photo_triage/cache/content_cache.hpp"
#include "photo_triage/clustering/clustering_engine.hpp"
#include "photo_triage/config/configuration.hpp"
#include "photo_triage/core/events.hpp"
#include "photo_triage/core/types.hpp"
#include "photo_triage/embedding/embedding_extractor.hpp"
#include "photo_triage/escalation/escalation.hpp"
#include "photo_triage/quality/quality_scorer.hpp"

#include <memory>
#include <ostream>
#include <vector>

namespace photo_triage::pipeline {

struct OrchestratorDeps {
  std::shared_ptr<cache::ContentCache> cache;                // null = no cache
  std::shared_ptr<embedding::EmbeddingExtractor> extractor;
  std::shared_ptr<clustering::ClusteringEngine> clustering;
  std::shared_ptr<quality::QualityScorer> scorer;
  std::shared_ptr<escalation::VisionLanguageClient> vlm;      // null = no Stage 2
  std::ostream *event_log = nullptr;                          // JSON-lines events
};

// Runs FINGERPRINT, ANALYZE, CLUSTERING, TIERING, ESCALATION and REPORT over
// a batch of image paths. Per-image failures never abort the run.
class Orchestrator {
public:
  // Throws PipelineError when a required strategy is missing.
  explicit Orchestrator(OrchestratorDeps deps);

  // Throws ValidationError for an invalid config (before any image is read)
  // and PipelineError when a required cache cannot be opened.
  PipelineReport run(const std::vector<fs::path> &paths, const config::Config &cfg);

private:
  OrchestratorDeps deps_;
  core::EventEmitter emitter_;
  std::ostream null_log_{nullptr};
};

} // namespace photo_triage::pipeline
