#include "photo_triage/clustering/clustering_engine.hpp"
#include "photo_triage/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using photo_triage::Burst;
using photo_triage::EmbeddingEntry;
using photo_triage::EmbeddingVector;
using photo_triage::clustering::DensityClusteringEngine;
using photo_triage::clustering::PerceptualHashClusteringEngine;

namespace {

EmbeddingEntry entry(const std::string& fp, std::initializer_list<float> values) {
  EmbeddingVector v(static_cast<Eigen::Index>(values.size()));
  Eigen::Index i = 0;
  for (float x : values) v[i++] = x;
  return {fp, v};
}

// Three near-identical shots and two unrelated ones.
std::vector<EmbeddingEntry> five_shot_session() {
  return {
    entry("a1", {1.0f, 0.02f, 0.0f}),
    entry("a2", {1.0f, 0.00f, 0.03f}),
    entry("a3", {0.98f, 0.03f, 0.01f}),
    entry("b1", {0.0f, 1.0f, 0.0f}),
    entry("c1", {0.0f, 0.0f, 1.0f}),
};
}

std::vector<std::vector<std::string>> partition(const std::vector<Burst>& bursts) {
  std::vector<std::vector<std::string>> out;
  for (const auto& b : bursts) out.push_back(b.fingerprints);
  return out;
}

} // namespace

TEST_CASE("cosine_distance_basic_values") {
  using photo_triage::clustering::cosine_distance;
  EmbeddingVector a(2), b(2), c(2);
  a << 1.0f, 0.0f;
  b << 0.0f, 1.0f;
  c << 2.0f, 0.0f;
  REQUIRE(cosine_distance(a, a) == Catch::Approx(0.0f).margin(1e-6));
  REQUIRE(cosine_distance(a, c) == Catch::Approx(0.0f).margin(1e-6));
  REQUIRE(cosine_distance(a, b) == Catch::Approx(1.0f));
  REQUIRE(cosine_distance(a, -a) == Catch::Approx(2.0f));
}

TEST_CASE("cosine_distance_matrix_is_symmetric_with_zero_diagonal") {
  photo_triage::Matrix2Df rows(3, 2);
  rows << 1.0f, 0.0f,
          0.0f, 2.0f,
          1.0f, 1.0f;
  auto d = photo_triage::clustering::cosine_distance_matrix(rows);
  REQUIRE(d(0, 0) == Catch::Approx(0.0f).margin(1e-6));
  REQUIRE(d(0, 1) == Catch::Approx(1.0f));
  REQUIRE(d(1, 0) == Catch::Approx(d(0, 1)));
  REQUIRE(d(0, 2) == Catch::Approx(1.0f - 1.0f / std::sqrt(2.0f)));
}

TEST_CASE("density_clustering_groups_five_shot_session") {
  DensityClusteringEngine engine(0.15f, 2);
  auto bursts = engine.cluster(five_shot_session());

  REQUIRE(bursts.size() == 3);
  REQUIRE(bursts[0].fingerprints == std::vector<std::string>{"a1", "a2", "a3"});
  REQUIRE(bursts[1].fingerprints == std::vector<std::string>{"b1"});
  REQUIRE(bursts[2].fingerprints == std::vector<std::string>{"c1"});
  REQUIRE(bursts[0].centroid.has_value());
}

TEST_CASE("density_clustering_is_invariant_to_input_order") {
  DensityClusteringEngine engine(0.15f, 2);
  auto base = five_shot_session();
  const auto expected = partition(engine.cluster(base));

  std::mt19937 rng(42);
  for (int trial = 0; trial < 10; ++trial) {
    std::shuffle(base.begin(), base.end(), rng);
    REQUIRE(partition(engine.cluster(base)) == expected);
  }
}

TEST_CASE("density_clustering_single_image_is_singleton") {
  DensityClusteringEngine engine(0.15f, 2);
  auto bursts = engine.cluster({entry("only", {0.3f, 0.4f})});
  REQUIRE(bursts.size() == 1);
  REQUIRE(bursts[0].fingerprints == std::vector<std::string>{"only"});
}

TEST_CASE("density_clustering_empty_input_gives_no_bursts") {
  DensityClusteringEngine engine(0.15f, 2);
  REQUIRE(engine.cluster({}).empty());
}

TEST_CASE("density_clustering_collapses_duplicate_fingerprints") {
  DensityClusteringEngine engine(0.15f, 2);
  auto bursts = engine.cluster({entry("x", {1.0f, 0.0f}), entry("x", {1.0f, 0.0f})});
  REQUIRE(bursts.size() == 1);
  REQUIRE(bursts[0].fingerprints.size() == 1);
}

TEST_CASE("density_clustering_distance_equal_to_epsilon_is_not_close") {
  // orthogonal vectors are exactly 1.0 apart
  DensityClusteringEngine engine(1.0f, 2);
  auto bursts = engine.cluster({entry("p", {1.0f, 0.0f}), entry("q", {0.0f, 1.0f})});
  REQUIRE(bursts.size() == 2);
}

TEST_CASE("density_clustering_min_samples_one_makes_every_point_core") {
  DensityClusteringEngine engine(0.15f, 1);
  auto bursts = engine.cluster(five_shot_session());
  REQUIRE(bursts.size() == 3);
}

TEST_CASE("density_clustering_high_min_samples_leaves_noise_singletons") {
  DensityClusteringEngine engine(0.15f, 4);
  auto bursts = engine.cluster(five_shot_session());
  REQUIRE(bursts.size() == 5);
  for (const auto& b : bursts) REQUIRE(b.fingerprints.size() == 1);
}

TEST_CASE("density_clustering_chains_through_core_points") {
  // neighbours 0.1 rad apart: ends are 0.3 rad apart (distance ~0.045)
  std::vector<EmbeddingEntry> chain;
  for (int i = 0; i < 4; ++i) {
    const float a = 0.1f * static_cast<float>(i);
    chain.push_back(entry("c" + std::to_string(i), {std::cos(a), std::sin(a)}));
  }
  DensityClusteringEngine engine(0.006f, 2);
  auto bursts = engine.cluster(chain);
  REQUIRE(bursts.size() == 1);
  REQUIRE(bursts[0].fingerprints.size() == 4);
}

TEST_CASE("phash_clustering_groups_by_hamming_distance") {
  auto bits = [](const std::string& fp, int flipped) {
    EmbeddingVector v = EmbeddingVector::Zero(64);
    for (int i = 0; i < flipped; ++i) v[i] = 1.0f;
    return EmbeddingEntry{fp, v};
  };
  PerceptualHashClusteringEngine engine(8);
  auto bursts = engine.cluster({bits("h3", 20), bits("h1", 0), bits("h2", 8)});

  REQUIRE(bursts.size() == 2);
  REQUIRE(bursts[0].fingerprints == std::vector<std::string>{"h1", "h2"});
  REQUIRE(bursts[1].fingerprints == std::vector<std::string>{"h3"});
}

TEST_CASE("assign_picks_prefers_lowest_score") {
  std::vector<Burst> bursts(1);
  bursts[0].fingerprints = {"a", "b", "c"};
  std::map<std::string, double> scores{{"a", 40.0}, {"b", 12.0}, {"c", 30.0}};
  std::map<std::string, std::vector<photo_triage::fs::path>> paths{
    {"a", {"/p/a.jpg"}}, {"b", {"/p/z.jpg", "/p/b.jpg"}}, {"c", {"/p/c.jpg"}}};

  photo_triage::clustering::assign_picks(bursts, scores, paths);
  REQUIRE(bursts[0].pick_fingerprint == "b");
  REQUIRE(bursts[0].pick_path == photo_triage::fs::path("/p/b.jpg"));
}

TEST_CASE("assign_picks_ties_go_to_smaller_fingerprint_and_unscored_rank_last") {
  std::vector<Burst> bursts(2);
  bursts[0].fingerprints = {"m", "k"};
  bursts[1].fingerprints = {"u", "v"};
  std::map<std::string, double> scores{{"m", 20.0}, {"k", 20.0}, {"v", 90.0}};

  photo_triage::clustering::assign_picks(bursts, scores, {});
  REQUIRE(bursts[0].pick_fingerprint == "k");
  REQUIRE(bursts[1].pick_fingerprint == "v");
  REQUIRE(bursts[1].pick_path.empty());
}
