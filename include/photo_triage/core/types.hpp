#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace photo_triage {

namespace fs = std::filesystem;

using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using EmbeddingVector = Eigen::VectorXf;

// Decode status of one input file
enum class DecodeStatus {
    PENDING,
    OK,
    UNREADABLE,      // bytes could not be read
    DECODE_FAILED    // bytes read, but not an image we can decode
};

inline std::string decode_status_to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::PENDING: return "pending";
        case DecodeStatus::OK: return "ok";
        case DecodeStatus::UNREADABLE: return "unreadable";
        case DecodeStatus::DECODE_FAILED: return "decode_failed";
        default: return "unknown";
    }
}

// Embedding keyed by fingerprint (one element of the fingerprint -> vector mapping)
struct EmbeddingEntry {
    std::string fingerprint;
    EmbeddingVector vector;
};

struct Burst {
    std::vector<std::string> fingerprints;   // sorted, unique
    std::vector<fs::path> paths;             // filled by the orchestrator, sorted
    std::string pick_fingerprint;
    fs::path pick_path;
    std::optional<EmbeddingVector> centroid;

    size_t size() const { return paths.empty() ? fingerprints.size() : paths.size(); }
};

// Stage-1 tier
enum class Stage1Tier {
    KEEPER,
    AMBIGUOUS,
    DUD
};

inline std::string stage1_tier_to_string(Stage1Tier tier) {
    switch (tier) {
        case Stage1Tier::KEEPER: return "keeper";
        case Stage1Tier::AMBIGUOUS: return "ambiguous";
        case Stage1Tier::DUD: return "dud";
        default: return "unknown";
    }
}

// Final verdict tier
enum class VerdictTier {
    KEEPER,
    AMBIGUOUS_ESCALATED,
    DUD,
    NEEDS_REVIEW
};

inline std::string verdict_tier_to_string(VerdictTier tier) {
    switch (tier) {
        case VerdictTier::KEEPER: return "keeper";
        case VerdictTier::AMBIGUOUS_ESCALATED: return "ambiguous_escalated";
        case VerdictTier::DUD: return "dud";
        case VerdictTier::NEEDS_REVIEW: return "needs_review";
        default: return "unknown";
    }
}

enum class Stage2Decision {
    KEEP,
    REJECT
};

inline std::string stage2_decision_to_string(Stage2Decision d) {
    return d == Stage2Decision::KEEP ? "keep" : "reject";
}

// Structured response of the vision-language model
struct StructuredVerdict {
    Stage2Decision decision = Stage2Decision::KEEP;
    std::string label;
    std::optional<std::string> critique;
};

// Stage-1 measurement. Lower score = less distortion.
struct QualityMeasurement {
    double score = 0.0;
    nlohmann::json metadata = nlohmann::json::object();
};

struct QualityVerdict {
    double stage1_score = 0.0;
    Stage1Tier stage1_tier = Stage1Tier::KEEPER;
    VerdictTier tier = VerdictTier::KEEPER;
    std::optional<StructuredVerdict> stage2;
    bool needs_review = false;
};

// Where a per-image failure happened
enum class FailureStage {
    FINGERPRINT,
    DECODE,
    EMBEDDING,
    QUALITY,
    ESCALATION,
    CACHE
};

inline std::string failure_stage_to_string(FailureStage stage) {
    switch (stage) {
        case FailureStage::FINGERPRINT: return "fingerprint";
        case FailureStage::DECODE: return "decode";
        case FailureStage::EMBEDDING: return "embedding";
        case FailureStage::QUALITY: return "quality";
        case FailureStage::ESCALATION: return "escalation";
        case FailureStage::CACHE: return "cache";
        default: return "unknown";
    }
}

struct FailureRecord {
    fs::path path;
    std::string fingerprint;   // empty if the file could not be read
    FailureStage stage = FailureStage::DECODE;
    std::string kind;          // e.g. "DecodeError", "EscalationTimeout"
    std::string message;
};

// Per-path entry of the report
// One physical image file and its outcome. The fingerprint is the identity,
// the path is not.
struct ImageReport {
    fs::path path;
    std::string fingerprint;   // sha256 hex of the file bytes, empty when unreadable
    uint64_t byte_size = 0;
    DecodeStatus decode_status = DecodeStatus::PENDING;
    std::optional<size_t> burst_index;
    std::optional<QualityVerdict> verdict;
    std::vector<FailureRecord> failures;
};

struct PipelineStats {
    size_t images = 0;
    size_t unique_fingerprints = 0;
    size_t embedding_cache_hits = 0;
    size_t embedding_cache_misses = 0;
    size_t quality_cache_hits = 0;
    size_t quality_cache_misses = 0;
    size_t embeddings_computed = 0;
    size_t scores_computed = 0;
    size_t escalations_issued = 0;
    size_t escalations_failed = 0;
    size_t cache_write_errors = 0;
};

struct PipelineReport {
    std::string run_id;
    bool dry_run = false;
    bool cache_enabled = true;
    std::string clustering_engine;
    std::string embedding_version;
    std::string quality_version;
    std::vector<Burst> bursts;
    std::map<std::string, ImageReport> images;   // keyed by path string
    std::vector<FailureRecord> failures;
    PipelineStats stats;
};

// Pipeline phase enumeration
enum class Phase {
    FINGERPRINT = 0,
    ANALYZE = 1,
    CLUSTERING = 2,
    TIERING = 3,
    ESCALATION = 4,
    REPORT = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::FINGERPRINT: return "FINGERPRINT";
        case Phase::ANALYZE: return "ANALYZE";
        case Phase::CLUSTERING: return "CLUSTERING";
        case Phase::TIERING: return "TIERING";
        case Phase::ESCALATION: return "ESCALATION";
        case Phase::REPORT: return "REPORT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace photo_triage
