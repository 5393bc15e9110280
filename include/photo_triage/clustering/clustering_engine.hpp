#pragma once

#include "photo_triage/core/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace photo_triage::clustering {

// Partitions fingerprint -> embedding entries into bursts. The result depends
// only on the set of entries, never on their order. Bursts are sorted by their
// smallest fingerprint, members by fingerprint.
class ClusteringEngine {
public:
  virtual ~ClusteringEngine() = default;

  virtual std::vector<Burst> cluster(const std::vector<EmbeddingEntry> &entries) = 0;
  virtual std::string name() const = 0;
};

// DBSCAN over cosine distance. Two points are close when distance < epsilon;
// a core point has at least min_samples close points, itself included.
// Noise points become singleton bursts.
class DensityClusteringEngine : public ClusteringEngine {
public:
  DensityClusteringEngine(double epsilon, int min_samples);

  std::vector<Burst> cluster(const std::vector<EmbeddingEntry> &entries) override;
  std::string name() const override { return "clip"; }

  double epsilon() const { return epsilon_; }
  int min_samples() const { return min_samples_; }

private:
  double epsilon_;
  int min_samples_;
};

// Greedy grouping of 0/1 hash vectors by Hamming distance.
class PerceptualHashClusteringEngine : public ClusteringEngine {
public:
  explicit PerceptualHashClusteringEngine(int max_distance);

  std::vector<Burst> cluster(const std::vector<EmbeddingEntry> &entries) override;
  std::string name() const override { return "phash"; }

private:
  int max_distance_;
};

float cosine_distance(const EmbeddingVector &a, const EmbeddingVector &b);

// Pairwise cosine distances of the rows (rows are normalized internally).
Matrix2Df cosine_distance_matrix(const Matrix2Df &rows);

int hamming_distance(const EmbeddingVector &a, const EmbeddingVector &b);

// Sorted by fingerprint, later duplicates of a fingerprint dropped.
std::vector<EmbeddingEntry> canonical_entries(const std::vector<EmbeddingEntry> &entries);

// Lowest score wins. Unscored members rank last, ties go to the smaller
// fingerprint. pick_path is the smallest path carrying the pick fingerprint.
void assign_picks(std::vector<Burst> &bursts,
                  const std::map<std::string, double> &scores,
                  const std::map<std::string, std::vector<fs::path>> &paths_by_fingerprint);

} // namespace photo_triage::clustering
