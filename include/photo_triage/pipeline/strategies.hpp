#pragma once

#include "photo_triage/cache/content_cache.hpp"
#include "photo_triage/clustering/clustering_engine.hpp"
#include "photo_triage/config/configuration.hpp"
#include "photo_triage/embedding/embedding_extractor.hpp"
#include "photo_triage/escalation/escalation.hpp"
#include "photo_triage/quality/quality_scorer.hpp"

#include <memory>

namespace photo_triage::pipeline {

// Strategy objects resolved once from the configuration.
struct Strategies {
  std::shared_ptr<embedding::EmbeddingExtractor> extractor;
  std::shared_ptr<clustering::ClusteringEngine> clustering;
  std::shared_ptr<quality::QualityScorer> scorer;
  std::shared_ptr<escalation::VisionLanguageClient> vlm;   // null when escalation is disabled
};

// clustering.engine clip|phash, quality.scorer brisque|laplacian.
// Throws ModelError when a model cannot be loaded.
Strategies make_strategies(const config::Config &cfg);

// DiskContentCache at cache.location, or NullContentCache when disabled.
std::shared_ptr<cache::ContentCache> make_cache(const config::Config &cfg);

} // namespace photo_triage::pipeline
