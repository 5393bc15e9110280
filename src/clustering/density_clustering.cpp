#include "photo_triage/clustering/clustering_engine.hpp"
#include "photo_triage/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <deque>

namespace photo_triage::clustering {

namespace {

constexpr int kNoise = -1;

} // namespace

float cosine_distance(const EmbeddingVector& a, const EmbeddingVector& b) {
    if (a.size() != b.size()) {
        throw PipelineError("embedding dimension mismatch");
    }
    const float na = a.norm();
    const float nb = b.norm();
    if (na < 1e-12f || nb < 1e-12f) {
        return 1.0f;
    }
    const float sim = a.dot(b) / (na * nb);
    return std::clamp(1.0f - sim, 0.0f, 2.0f);
}

Matrix2Df cosine_distance_matrix(const Matrix2Df& rows) {
    Matrix2Df normalized = rows;
    for (Eigen::Index i = 0; i < normalized.rows(); ++i) {
        const float n = normalized.row(i).norm();
        if (n > 1e-12f) {
            normalized.row(i) /= n;
        }
    }

    Matrix2Df dist = Matrix2Df::Ones(rows.rows(), rows.rows()) - normalized * normalized.transpose();
    dist = dist.cwiseMax(0.0f).cwiseMin(2.0f);
    dist.diagonal().setZero();
    return dist;
}

std::vector<EmbeddingEntry> canonical_entries(const std::vector<EmbeddingEntry>& entries) {
    std::vector<EmbeddingEntry> sorted = entries;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const EmbeddingEntry& a, const EmbeddingEntry& b) {
                         return a.fingerprint < b.fingerprint;
                     });
    sorted.erase(std::unique(sorted.begin(), sorted.end(),
                             [](const EmbeddingEntry& a, const EmbeddingEntry& b) {
                                 return a.fingerprint == b.fingerprint;
                             }),
                 sorted.end());
    return sorted;
}

DensityClusteringEngine::DensityClusteringEngine(double epsilon, int min_samples)
    : epsilon_(epsilon), min_samples_(min_samples) {
    if (!(epsilon_ > 0.0)) {
        throw ConfigError("clustering epsilon must be > 0");
    }
    if (min_samples_ < 1) {
        throw ConfigError("clustering min_samples must be >= 1");
    }
}

std::vector<Burst> DensityClusteringEngine::cluster(const std::vector<EmbeddingEntry>& entries) {
    const auto pts = canonical_entries(entries);
    const int n = static_cast<int>(pts.size());
    if (n == 0) {
        return {};
    }

    const Eigen::Index d = pts[0].vector.size();
    Matrix2Df X(n, d);
    for (int i = 0; i < n; ++i) {
        if (pts[static_cast<size_t>(i)].vector.size() != d) {
            throw PipelineError("embedding dimension mismatch for " + pts[static_cast<size_t>(i)].fingerprint);
        }
        X.row(i) = pts[static_cast<size_t>(i)].vector.transpose();
    }

    const Matrix2Df D = cosine_distance_matrix(X);

    std::vector<std::vector<int>> neighbors(static_cast<size_t>(n));
    std::vector<bool> core(static_cast<size_t>(n), false);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (static_cast<double>(D(i, j)) < epsilon_) {
                neighbors[static_cast<size_t>(i)].push_back(j);
            }
        }
        core[static_cast<size_t>(i)] =
            static_cast<int>(neighbors[static_cast<size_t>(i)].size()) >= min_samples_;
    }

    std::vector<int> labels(static_cast<size_t>(n), kNoise);
    int next_label = 0;
    for (int i = 0; i < n; ++i) {
        if (labels[static_cast<size_t>(i)] != kNoise || !core[static_cast<size_t>(i)]) {
            continue;
        }
        const int c = next_label++;
        labels[static_cast<size_t>(i)] = c;

        std::deque<int> queue{i};
        while (!queue.empty()) {
            const int q = queue.front();
            queue.pop_front();
            for (int j : neighbors[static_cast<size_t>(q)]) {
                if (labels[static_cast<size_t>(j)] != kNoise) {
                    continue;
                }
                labels[static_cast<size_t>(j)] = c;
                if (core[static_cast<size_t>(j)]) {
                    queue.push_back(j);
                }
            }
        }
    }

    std::vector<std::vector<int>> groups(static_cast<size_t>(next_label));
    for (int i = 0; i < n; ++i) {
        const int l = labels[static_cast<size_t>(i)];
        if (l == kNoise) {
            groups.push_back({i});
        } else {
            groups[static_cast<size_t>(l)].push_back(i);
        }
    }

    std::vector<Burst> bursts;
    bursts.reserve(groups.size());
    for (const auto& g : groups) {
        Burst b;
        EmbeddingVector centroid = EmbeddingVector::Zero(d);
        for (int idx : g) {
            b.fingerprints.push_back(pts[static_cast<size_t>(idx)].fingerprint);
            EmbeddingVector v = X.row(idx).transpose();
            const float nv = v.norm();
            if (nv > 1e-12f) v /= nv;
            centroid += v;
        }
        centroid /= static_cast<float>(g.size());
        b.centroid = centroid;
        bursts.push_back(std::move(b));
    }

    std::sort(bursts.begin(), bursts.end(), [](const Burst& a, const Burst& b) {
        return a.fingerprints.front() < b.fingerprints.front();
    });
    return bursts;
}

} // namespace photo_triage::clustering
