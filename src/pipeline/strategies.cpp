#include "photo_triage/pipeline/strategies.hpp"
#include "photo_triage/core/errors.hpp"

namespace photo_triage::pipeline {

Strategies make_strategies(const config::Config& cfg) {
    Strategies s;

    if (cfg.clustering.engine == "clip") {
        embedding::DnnEmbeddingOptions opt;
        opt.model_path = cfg.embedding.model_path;
        opt.model_version = cfg.embedding.model_version;
        opt.input_size = cfg.embedding.input_size;
        s.extractor = std::make_shared<embedding::DnnEmbeddingExtractor>(opt);
        s.clustering = std::make_shared<clustering::DensityClusteringEngine>(
            cfg.clustering.epsilon, cfg.clustering.min_samples);
    } else if (cfg.clustering.engine == "phash") {
        s.extractor = std::make_shared<embedding::PerceptualHashExtractor>();
        s.clustering = std::make_shared<clustering::PerceptualHashClusteringEngine>(
            cfg.clustering.phash_max_distance);
    } else {
        throw ConfigError("unknown clustering.engine '" + cfg.clustering.engine + "'");
    }

    if (cfg.quality.scorer == "brisque") {
        quality::BrisqueOptions opt;
        opt.model_path = cfg.quality.brisque_model_path;
        opt.range_path = cfg.quality.brisque_range_path;
        opt.max_dimension = cfg.quality.max_dimension;
        s.scorer = std::make_shared<quality::BrisqueScorer>(opt);
    } else if (cfg.quality.scorer == "laplacian") {
        quality::LaplacianOptions opt;
        opt.patch_size = cfg.quality.laplacian_patch_size;
        opt.reference = cfg.quality.laplacian_reference;
        opt.max_dimension = cfg.quality.max_dimension;
        s.scorer = std::make_shared<quality::LaplacianPatchScorer>(opt);
    } else {
        throw ConfigError("unknown quality.scorer '" + cfg.quality.scorer + "'");
    }

    if (cfg.escalation.enabled) {
        escalation::OllamaOptions opt;
        opt.endpoint = cfg.escalation.endpoint;
        opt.model = cfg.escalation.model;
        opt.timeout_seconds = cfg.escalation.timeout_seconds;
        s.vlm = std::make_shared<escalation::OllamaVisionClient>(opt);
    }

    return s;
}

std::shared_ptr<cache::ContentCache> make_cache(const config::Config& cfg) {
    if (!cfg.cache.enabled) {
        return std::make_shared<cache::NullContentCache>();
    }
    return std::make_shared<cache::DiskContentCache>(cfg.cache.location);
}

} // namespace photo_triage::pipeline
