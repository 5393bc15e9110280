#include "photo_triage/pipeline/orchestrator.hpp"
#include "photo_triage/cache/fingerprint.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"
#include "photo_triage/image/decode.hpp"
#include "photo_triage/quality/tiering.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace photo_triage::pipeline {

namespace {

std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const CacheIOError*>(&e)) return "CacheIOError";
    if (dynamic_cast<const IOError*>(&e)) return "IOError";
    if (dynamic_cast<const DecodeError*>(&e)) return "DecodeError";
    if (dynamic_cast<const ModelError*>(&e)) return "ModelError";
    if (auto* esc = dynamic_cast<const EscalationError*>(&e)) return esc->kind();
    if (dynamic_cast<const PipelineError*>(&e)) return "PipelineError";
    return "Error";
}

// Shared atomic work index; runs inline when there is a single worker.
// The first exception thrown by fn is rethrown after all workers joined.
void parallel_for(size_t n, int workers, const std::function<void(size_t)>& fn) {
    if (n == 0) return;
    const size_t w = std::min(static_cast<size_t>(std::max(1, workers)), n);

    if (w == 1) {
        for (size_t i = 0; i < n; ++i) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> pool;
    pool.reserve(w);
    for (size_t t = 0; t < w; ++t) {
        pool.emplace_back([&]() {
            while (true) {
                size_t i = next.fetch_add(1);
                if (i >= n) break;
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    next.store(n);
                }
            }
        });
    }
    for (auto& th : pool) {
        th.join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

// Closes the cache on every exit path of a run.
class CacheSession {
public:
    explicit CacheSession(cache::ContentCache& c) : cache_(c) {}
    ~CacheSession() { cache_.close(); }

    CacheSession(const CacheSession&) = delete;
    CacheSession& operator=(const CacheSession&) = delete;

private:
    cache::ContentCache& cache_;
};

struct PathSlot {
    fs::path path;
    std::string fingerprint;
    uint64_t byte_size = 0;
    std::optional<FailureRecord> failure;
};

struct StageFailure {
    FailureStage stage;
    std::string kind;
    std::string message;
};

struct AnalysisSlot {
    std::string fingerprint;
    std::vector<fs::path> paths;
    DecodeStatus decode_status = DecodeStatus::PENDING;
    std::optional<EmbeddingVector> embedding;
    bool embedding_cached = false;
    std::optional<QualityMeasurement> quality;
    std::vector<StageFailure> failures;
};

struct EscalationSlot {
    std::string fingerprint;
    fs::path path;
    escalation::EscalationOutcome outcome;
};

// Cached payloads of the wrong shape are misses.
std::optional<EmbeddingVector> cached_embedding(const cache::CachePayload& payload, int expected_dim) {
    if (payload.values.empty()) return std::nullopt;
    if (expected_dim > 0 && payload.values.size() != static_cast<size_t>(expected_dim)) {
        return std::nullopt;
    }
    EmbeddingVector v = Eigen::Map<const EmbeddingVector>(
        payload.values.data(), static_cast<Eigen::Index>(payload.values.size()));
    if (!v.allFinite()) return std::nullopt;
    return v;
}

std::optional<QualityMeasurement> cached_quality(const cache::CachePayload& payload) {
    if (!payload.score || !std::isfinite(*payload.score)) return std::nullopt;
    return QualityMeasurement{*payload.score, payload.metadata};
}

bool failure_less(const FailureRecord& a, const FailureRecord& b) {
    if (a.path != b.path) return a.path < b.path;
    if (a.stage != b.stage) return a.stage < b.stage;
    return a.kind < b.kind;
}

} // namespace

Orchestrator::Orchestrator(OrchestratorDeps deps) : deps_(std::move(deps)) {
    if (!deps_.extractor) {
        throw PipelineError("no embedding extractor");
    }
    if (!deps_.clustering) {
        throw PipelineError("no clustering engine");
    }
    if (!deps_.scorer) {
        throw PipelineError("no quality scorer");
    }
}

PipelineReport Orchestrator::run(const std::vector<fs::path>& input_paths,
                                 const config::Config& cfg) {
    cfg.validate();

    std::ostream& log = deps_.event_log ? *deps_.event_log : null_log_;
    core::EventEmitter& emitter = emitter_;

    PipelineReport report;
    report.run_id = core::get_run_id();
    report.dry_run = cfg.runtime.dry_run;
    report.clustering_engine = deps_.clustering->name();
    report.embedding_version = deps_.extractor->producer_version();
    report.quality_version = deps_.scorer->producer_version();
    const std::string& run_id = report.run_id;

    const int workers = cfg.effective_worker_count();
    const quality::TierThresholds thresholds{cfg.quality.keeper_threshold,
                                             cfg.quality.ambiguous_threshold};

    // Cache lifecycle
    std::shared_ptr<cache::ContentCache> store = deps_.cache;
    if (!store || !cfg.cache.enabled) {
        store = std::make_shared<cache::NullContentCache>();
    }
    try {
        store->open();
    } catch (const CacheIOError& e) {
        if (cfg.cache.required) {
            emitter.error(run_id, e.what(), log);
            throw PipelineError(std::string("cache required but unavailable: ") + e.what());
        }
        emitter.warning(run_id, std::string("cache disabled for this run: ") + e.what(), log);
        store = std::make_shared<cache::NullContentCache>();
    }
    report.cache_enabled = store->persistent();
    CacheSession cache_session(*store);

    std::vector<fs::path> paths;
    paths.reserve(input_paths.size());
    for (const auto& p : input_paths) {
        paths.push_back(p.lexically_normal());
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    report.stats.images = paths.size();

    emitter.run_start(run_id,
                      {{"images", paths.size()},
                       {"workers", workers},
                       {"dry_run", cfg.runtime.dry_run},
                       {"cache", store->describe()},
                       {"clustering", report.clustering_engine},
                       {"embedding_version", report.embedding_version},
                       {"quality_version", report.quality_version}},
                      log);

    std::mutex progress_mutex;
    auto progress = [&](Phase phase, size_t done, size_t total, const std::string& unit) {
        if (done % 20 == 0 || done == total) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            emitter.phase_progress_counts(run_id, phase, static_cast<int>(done),
                                          static_cast<int>(total),
                                          "workers=" + std::to_string(workers), unit, log);
        }
    };

    // Phase: FINGERPRINT
    emitter.phase_start(run_id, Phase::FINGERPRINT, "FINGERPRINT", log);
    std::vector<PathSlot> path_slots(paths.size());
    {
        std::atomic<size_t> done{0};
        parallel_for(paths.size(), workers, [&](size_t i) {
            PathSlot& slot = path_slots[i];
            slot.path = paths[i];
            try {
                auto bytes = core::read_bytes(slot.path);
                slot.byte_size = bytes.size();
                slot.fingerprint = cache::fingerprint_bytes(bytes);
            } catch (const IOError& e) {
                slot.failure = FailureRecord{slot.path, "", FailureStage::FINGERPRINT,
                                             error_kind(e), e.what()};
            }
            progress(Phase::FINGERPRINT, ++done, paths.size(), "images");
        });
    }

    std::map<std::string, std::vector<fs::path>> paths_by_fp;
    size_t unreadable = 0;
    for (const auto& slot : path_slots) {
        if (slot.failure) {
            ++unreadable;
            emitter.image_failed(run_id, Phase::FINGERPRINT, *slot.failure, log);
            continue;
        }
        paths_by_fp[slot.fingerprint].push_back(slot.path);
    }
    report.stats.unique_fingerprints = paths_by_fp.size();
    emitter.phase_end(run_id, Phase::FINGERPRINT, "ok",
                      {{"images", paths.size()},
                       {"unique_fingerprints", paths_by_fp.size()},
                       {"unreadable", unreadable}},
                      log);

    // Phase: ANALYZE
    emitter.phase_start(run_id, Phase::ANALYZE, "ANALYZE", log);
    std::vector<AnalysisSlot> analysis;
    analysis.reserve(paths_by_fp.size());
    for (const auto& [fp, fp_paths] : paths_by_fp) {
        AnalysisSlot slot;
        slot.fingerprint = fp;
        slot.paths = fp_paths;
        analysis.push_back(std::move(slot));
    }

    std::atomic<size_t> emb_hits{0}, emb_misses{0}, q_hits{0}, q_misses{0};
    std::atomic<size_t> emb_computed{0}, scores_computed{0}, cache_write_errors{0};
    std::atomic<int> computed_dim{0};
    {
        const std::string emb_version = deps_.extractor->producer_version();
        const std::string q_version = deps_.scorer->producer_version();
        std::atomic<size_t> done{0};

        auto store_entry = [&](const std::string& fp, cache::EntryKind kind,
                               const std::string& version, const cache::CachePayload& payload) {
            try {
                store->put(fp, kind, version, payload);
            } catch (const CacheIOError& e) {
                cache_write_errors.fetch_add(1);
                emitter.warning(run_id, std::string("cache write failed for ") + fp + ": " + e.what(), log);
            }
        };

        // Reads, decodes and computes whatever the cache did not provide.
        auto compute_missing = [&](AnalysisSlot& slot) {
            const std::string& fp = slot.fingerprint;
            cv::Mat img;
            try {
                auto bytes = core::read_bytes(slot.paths.front());
                if (cache::fingerprint_bytes(bytes) != fp) {
                    throw IOError("file changed during the run: " + slot.paths.front().string());
                }
                img = image::decode_image(bytes, slot.paths.front().string());
                slot.decode_status = DecodeStatus::OK;
            } catch (const IOError& e) {
                slot.decode_status = DecodeStatus::UNREADABLE;
                slot.failures.push_back({FailureStage::DECODE, error_kind(e), e.what()});
            } catch (const DecodeError& e) {
                slot.decode_status = DecodeStatus::DECODE_FAILED;
                slot.failures.push_back({FailureStage::DECODE, error_kind(e), e.what()});
            }
            if (slot.decode_status != DecodeStatus::OK) return;

            if (!slot.embedding) {
                try {
                    EmbeddingVector v = deps_.extractor->embed(img);
                    emb_computed.fetch_add(1);
                    int expected = 0;
                    computed_dim.compare_exchange_strong(expected, static_cast<int>(v.size()));
                    cache::CachePayload payload;
                    payload.values.assign(v.data(), v.data() + v.size());
                    store_entry(fp, cache::EntryKind::EMBEDDING, emb_version, payload);
                    slot.embedding = std::move(v);
                } catch (const std::exception& e) {
                    slot.failures.push_back({FailureStage::EMBEDDING, error_kind(e), e.what()});
                }
            }
            if (!slot.quality) {
                try {
                    QualityMeasurement m = deps_.scorer->score(img);
                    scores_computed.fetch_add(1);
                    cache::CachePayload payload;
                    payload.score = m.score;
                    payload.metadata = m.metadata;
                    store_entry(fp, cache::EntryKind::QUALITY_SCORE, q_version, payload);
                    slot.quality = std::move(m);
                } catch (const std::exception& e) {
                    slot.failures.push_back({FailureStage::QUALITY, error_kind(e), e.what()});
                }
            }
        };

        auto unusable = [&](const std::string& fp, cache::EntryKind kind) {
            emitter.warning(run_id,
                            "ignoring unusable cached " + cache::entry_kind_to_string(kind) +
                                " for " + fp,
                            log);
        };

        parallel_for(analysis.size(), workers, [&](size_t i) {
            AnalysisSlot& slot = analysis[i];
            const std::string& fp = slot.fingerprint;

            if (auto hit = store->get(fp, cache::EntryKind::EMBEDDING, emb_version)) {
                slot.embedding = cached_embedding(hit->payload, deps_.extractor->dimension());
                if (!slot.embedding) unusable(fp, cache::EntryKind::EMBEDDING);
            }
            if (slot.embedding) {
                slot.embedding_cached = true;
                emb_hits.fetch_add(1);
            } else {
                emb_misses.fetch_add(1);
            }

            if (auto hit = store->get(fp, cache::EntryKind::QUALITY_SCORE, q_version)) {
                slot.quality = cached_quality(hit->payload);
                if (!slot.quality) unusable(fp, cache::EntryKind::QUALITY_SCORE);
            }
            if (slot.quality) {
                q_hits.fetch_add(1);
            } else {
                q_misses.fetch_add(1);
            }

            if (slot.embedding && slot.quality) {
                slot.decode_status = DecodeStatus::OK;
            } else {
                compute_missing(slot);
            }
            progress(Phase::ANALYZE, ++done, analysis.size(), "fingerprints");
        });

        // Cached vectors whose length differs from the extractor output are
        // recomputed, so every vector handed to clustering has one dimension.
        int expected_dim = deps_.extractor->dimension();
        if (expected_dim <= 0) expected_dim = computed_dim.load();
        if (expected_dim <= 0) {
            std::map<Eigen::Index, size_t> sizes;
            for (const auto& slot : analysis) {
                if (slot.embedding) ++sizes[slot.embedding->size()];
            }
            size_t best = 0;
            for (const auto& [dim, count] : sizes) {
                if (count > best) {
                    best = count;
                    expected_dim = static_cast<int>(dim);
                }
            }
        }

        std::vector<size_t> stale;
        for (size_t i = 0; i < analysis.size(); ++i) {
            AnalysisSlot& slot = analysis[i];
            if (slot.embedding_cached && slot.embedding->size() != expected_dim) {
                unusable(slot.fingerprint, cache::EntryKind::EMBEDDING);
                slot.embedding.reset();
                slot.embedding_cached = false;
                stale.push_back(i);
            }
        }
        emb_hits.fetch_sub(stale.size());
        emb_misses.fetch_add(stale.size());
        parallel_for(stale.size(), workers, [&](size_t k) { compute_missing(analysis[stale[k]]); });
    }

    report.stats.embedding_cache_hits = emb_hits.load();
    report.stats.embedding_cache_misses = emb_misses.load();
    report.stats.quality_cache_hits = q_hits.load();
    report.stats.quality_cache_misses = q_misses.load();
    report.stats.embeddings_computed = emb_computed.load();
    report.stats.scores_computed = scores_computed.load();
    report.stats.cache_write_errors = cache_write_errors.load();

    // Per-path failure lists
    std::map<fs::path, std::vector<FailureRecord>> failures_by_path;
    for (const auto& slot : path_slots) {
        if (slot.failure) failures_by_path[slot.path].push_back(*slot.failure);
    }
    size_t failed_fps = 0;
    for (const auto& slot : analysis) {
        if (!slot.failures.empty()) ++failed_fps;
        for (const auto& f : slot.failures) {
            for (const auto& p : slot.paths) {
                FailureRecord rec{p, slot.fingerprint, f.stage, f.kind, f.message};
                emitter.image_failed(run_id, Phase::ANALYZE, rec, log);
                failures_by_path[p].push_back(std::move(rec));
            }
        }
    }
    emitter.phase_end(run_id, Phase::ANALYZE, "ok",
                      {{"fingerprints", analysis.size()},
                       {"failed", failed_fps},
                       {"embedding_cache_hits", report.stats.embedding_cache_hits},
                       {"embedding_cache_misses", report.stats.embedding_cache_misses},
                       {"quality_cache_hits", report.stats.quality_cache_hits},
                       {"quality_cache_misses", report.stats.quality_cache_misses},
                       {"cache_write_errors", report.stats.cache_write_errors}},
                      log);

    // Phase: CLUSTERING
    emitter.phase_start(run_id, Phase::CLUSTERING, "CLUSTERING", log);
    std::vector<EmbeddingEntry> entries;
    std::map<std::string, double> scores;
    for (const auto& slot : analysis) {
        if (slot.embedding) entries.push_back({slot.fingerprint, *slot.embedding});
        if (slot.quality) scores[slot.fingerprint] = slot.quality->score;
    }

    try {
        report.bursts = deps_.clustering->cluster(entries);
    } catch (const std::exception& e) {
        emitter.phase_end(run_id, Phase::CLUSTERING, "error", {{"error", e.what()}}, log);
        emitter.run_end(run_id, false, "error", log);
        throw;
    }
    for (auto& b : report.bursts) {
        for (const auto& fp : b.fingerprints) {
            const auto& fp_paths = paths_by_fp[fp];
            b.paths.insert(b.paths.end(), fp_paths.begin(), fp_paths.end());
        }
        std::sort(b.paths.begin(), b.paths.end());
    }
    clustering::assign_picks(report.bursts, scores, paths_by_fp);

    std::map<std::string, size_t> burst_of_fp;
    size_t multi = 0;
    for (size_t bi = 0; bi < report.bursts.size(); ++bi) {
        if (report.bursts[bi].size() > 1) ++multi;
        for (const auto& fp : report.bursts[bi].fingerprints) burst_of_fp[fp] = bi;
    }
    emitter.phase_end(run_id, Phase::CLUSTERING, "ok",
                      {{"embeddings", entries.size()},
                       {"bursts", report.bursts.size()},
                       {"multi_image_bursts", multi}},
                      log);

    // Phase: TIERING
    emitter.phase_start(run_id, Phase::TIERING, "TIERING", log);
    std::vector<EscalationSlot> to_escalate;
    size_t keepers = 0, ambiguous = 0, duds = 0;
    for (const auto& slot : analysis) {
        if (!slot.quality) continue;
        switch (quality::classify_stage1(slot.quality->score, thresholds)) {
            case Stage1Tier::KEEPER: ++keepers; break;
            case Stage1Tier::DUD: ++duds; break;
            case Stage1Tier::AMBIGUOUS:
                ++ambiguous;
                if (cfg.escalation.enabled && deps_.vlm) {
                    to_escalate.push_back({slot.fingerprint, slot.paths.front(), {}});
                }
                break;
        }
    }
    emitter.phase_end(run_id, Phase::TIERING, "ok",
                      {{"keeper", keepers}, {"ambiguous", ambiguous}, {"dud", duds}}, log);

    // Phase: ESCALATION
    emitter.phase_start(run_id, Phase::ESCALATION, "ESCALATION", log);
    std::map<std::string, std::optional<StructuredVerdict>> stage2;
    if (!to_escalate.empty()) {
        escalation::EscalationCascade cascade(deps_.vlm);
        std::atomic<size_t> done{0};
        parallel_for(to_escalate.size(), cfg.effective_escalation_concurrency(), [&](size_t i) {
            EscalationSlot& slot = to_escalate[i];
            escalation::EscalationContext ctx;
            ctx.fingerprint = slot.fingerprint;
            ctx.path = slot.path;
            ctx.stage1_score = scores.at(slot.fingerprint);
            try {
                ctx.image_bytes = core::read_bytes(slot.path);
                slot.outcome = cascade.escalate(ctx);
            } catch (const IOError& e) {
                slot.outcome.error_kind = error_kind(e);
                slot.outcome.error_message = e.what();
            }
            progress(Phase::ESCALATION, ++done, to_escalate.size(), "images");
        });

        for (const auto& slot : to_escalate) {
            ++report.stats.escalations_issued;
            stage2[slot.fingerprint] = slot.outcome.verdict;
            if (slot.outcome.ok()) continue;

            ++report.stats.escalations_failed;
            for (const auto& p : paths_by_fp[slot.fingerprint]) {
                FailureRecord rec{p, slot.fingerprint, FailureStage::ESCALATION,
                                  slot.outcome.error_kind, slot.outcome.error_message};
                emitter.image_failed(run_id, Phase::ESCALATION, rec, log);
                failures_by_path[p].push_back(std::move(rec));
            }
        }
        emitter.phase_end(run_id, Phase::ESCALATION, "ok",
                          {{"escalated", report.stats.escalations_issued},
                           {"failed", report.stats.escalations_failed}},
                          log);
    } else {
        emitter.phase_end(run_id, Phase::ESCALATION, "skipped",
                          {{"reason", ambiguous == 0 ? "no_ambiguous_images" : "escalation_disabled"}},
                          log);
    }

    // Phase: REPORT
    emitter.phase_start(run_id, Phase::REPORT, "REPORT", log);
    std::map<std::string, const AnalysisSlot*> slot_of_fp;
    for (const auto& slot : analysis) slot_of_fp[slot.fingerprint] = &slot;

    for (const auto& ps : path_slots) {
        ImageReport ir;
        ir.path = ps.path;
        ir.fingerprint = ps.fingerprint;
        ir.byte_size = ps.byte_size;

        if (ps.failure) {
            ir.decode_status = DecodeStatus::UNREADABLE;
        } else {
            auto bit = burst_of_fp.find(ps.fingerprint);
            if (bit != burst_of_fp.end()) ir.burst_index = bit->second;

            const AnalysisSlot* slot = slot_of_fp[ps.fingerprint];
            if (slot) ir.decode_status = slot->decode_status;
            if (slot && slot->quality) {
                std::optional<StructuredVerdict> s2;
                auto sit = stage2.find(ps.fingerprint);
                if (sit != stage2.end()) s2 = sit->second;
                ir.verdict = quality::resolve_verdict(slot->quality->score, thresholds, s2);
            }
        }

        auto fit = failures_by_path.find(ps.path);
        if (fit != failures_by_path.end()) {
            ir.failures = fit->second;
            std::sort(ir.failures.begin(), ir.failures.end(), failure_less);
            report.failures.insert(report.failures.end(), ir.failures.begin(), ir.failures.end());
        }
        report.images[ps.path.string()] = std::move(ir);
    }
    std::sort(report.failures.begin(), report.failures.end(), failure_less);

    emitter.phase_end(run_id, Phase::REPORT, "ok",
                      {{"images", report.images.size()},
                       {"bursts", report.bursts.size()},
                       {"failures", report.failures.size()}},
                      log);
    emitter.run_end(run_id, true, "ok", log);
    return report;
}

} // namespace photo_triage::pipeline
