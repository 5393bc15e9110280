#include "photo_triage/clustering/clustering_engine.hpp"
#include "photo_triage/core/errors.hpp"

#include <algorithm>

namespace photo_triage::clustering {

int hamming_distance(const EmbeddingVector& a, const EmbeddingVector& b) {
    if (a.size() != b.size()) {
        throw PipelineError("hash length mismatch");
    }
    int d = 0;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if ((a[i] > 0.5f) != (b[i] > 0.5f)) ++d;
    }
    return d;
}

PerceptualHashClusteringEngine::PerceptualHashClusteringEngine(int max_distance)
    : max_distance_(max_distance) {
    if (max_distance_ < 0) {
        throw ConfigError("phash max distance must be >= 0");
    }
}

std::vector<Burst> PerceptualHashClusteringEngine::cluster(const std::vector<EmbeddingEntry>& entries) {
    const auto pts = canonical_entries(entries);
    const size_t n = pts.size();

    std::vector<bool> visited(n, false);
    std::vector<Burst> bursts;
    for (size_t i = 0; i < n; ++i) {
        if (visited[i]) continue;
        visited[i] = true;

        Burst b;
        b.fingerprints.push_back(pts[i].fingerprint);
        for (size_t j = i + 1; j < n; ++j) {
            if (visited[j]) continue;
            if (hamming_distance(pts[i].vector, pts[j].vector) <= max_distance_) {
                visited[j] = true;
                b.fingerprints.push_back(pts[j].fingerprint);
            }
        }
        bursts.push_back(std::move(b));
    }

    // seeds are visited in fingerprint order, so bursts are already canonical
    return bursts;
}

} // namespace photo_triage::clustering
