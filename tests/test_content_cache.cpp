#include "photo_triage/cache/content_cache.hpp"
#include "photo_triage/cache/fingerprint.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using photo_triage::CacheIOError;
using photo_triage::cache::CachePayload;
using photo_triage::cache::DiskContentCache;
using photo_triage::cache::EntryKind;
using photo_triage::cache::InMemoryContentCache;
using photo_triage::cache::NullContentCache;
using photo_triage::cache::PutResult;
using photo_triage::testing::TempDir;

namespace {

std::string fp_of(const std::string& content) {
  return photo_triage::cache::fingerprint_bytes(
      std::vector<uint8_t>(content.begin(), content.end()));
}

CachePayload embedding_payload(std::vector<float> v) {
  CachePayload p;
  p.values = std::move(v);
  return p;
}

CachePayload score_payload(double s) {
  CachePayload p;
  p.score = s;
  p.metadata = {{"blacks", 0.125}, {"whites", 0.0}};
  return p;
}

} // namespace

TEST_CASE("disk_cache_miss_is_nullopt") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  cache.open();
  REQUIRE_FALSE(cache.get(fp_of("a"), EntryKind::EMBEDDING, "v1").has_value());
}

TEST_CASE("disk_cache_put_then_get_returns_payload") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store", [] { return int64_t{1000}; });
  cache.open();

  const auto fp = fp_of("image-bytes");
  REQUIRE(cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({0.1f, 0.2f, 0.3f})) ==
          PutResult::WRITTEN);
  REQUIRE(cache.put(fp, EntryKind::QUALITY_SCORE, "q1", score_payload(41.25)) ==
          PutResult::WRITTEN);

  auto e = cache.get(fp, EntryKind::EMBEDDING, "v1");
  REQUIRE(e.has_value());
  REQUIRE(e->fingerprint == fp);
  REQUIRE(e->created_at == 1000);
  REQUIRE(e->payload.values == std::vector<float>{0.1f, 0.2f, 0.3f});

  auto q = cache.get(fp, EntryKind::QUALITY_SCORE, "q1");
  REQUIRE(q.has_value());
  REQUIRE(q->payload.score.has_value());
  REQUIRE(*q->payload.score == Catch::Approx(41.25));
  REQUIRE(q->payload.metadata["blacks"].get<double>() == Catch::Approx(0.125));
}

TEST_CASE("disk_cache_identical_put_is_noop") {
  TempDir dir;
  int64_t now = 100;
  DiskContentCache cache(dir.path() / "store", [&] { return now; });
  cache.open();

  const auto fp = fp_of("same");
  REQUIRE(cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f, 2.0f})) ==
          PutResult::WRITTEN);
  now = 200;
  REQUIRE(cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f, 2.0f})) ==
          PutResult::UNCHANGED);

  // the original entry is untouched
  REQUIRE(cache.get(fp, EntryKind::EMBEDDING, "v1")->created_at == 100);
}

TEST_CASE("disk_cache_version_mismatch_is_miss_and_replaced") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  cache.open();

  const auto fp = fp_of("versioned");
  cache.put(fp, EntryKind::EMBEDDING, "model-a", embedding_payload({1.0f}));
  REQUIRE_FALSE(cache.get(fp, EntryKind::EMBEDDING, "model-b").has_value());

  REQUIRE(cache.put(fp, EntryKind::EMBEDDING, "model-b", embedding_payload({2.0f})) ==
          PutResult::WRITTEN);
  REQUIRE_FALSE(cache.get(fp, EntryKind::EMBEDDING, "model-a").has_value());
  REQUIRE(cache.get(fp, EntryKind::EMBEDDING, "model-b")->payload.values ==
          std::vector<float>{2.0f});
}

TEST_CASE("disk_cache_kinds_are_independent") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  cache.open();

  const auto fp = fp_of("kinds");
  cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  REQUIRE_FALSE(cache.get(fp, EntryKind::QUALITY_SCORE, "v1").has_value());
}

TEST_CASE("disk_cache_corrupt_entry_is_miss") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  cache.open();

  const auto fp = fp_of("corrupt");
  cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  photo_triage::testing::write_file(cache.entry_path(fp, EntryKind::EMBEDDING), "{not json");

  REQUIRE_FALSE(cache.get(fp, EntryKind::EMBEDDING, "v1").has_value());
  REQUIRE(cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f})) ==
          PutResult::WRITTEN);
  REQUIRE(cache.get(fp, EntryKind::EMBEDDING, "v1").has_value());
}

TEST_CASE("disk_cache_survives_fresh_instance") {
  TempDir dir;
  const auto fp = fp_of("persist");
  {
    DiskContentCache writer(dir.path() / "store");
    writer.open();
    writer.put(fp, EntryKind::QUALITY_SCORE, "q1", score_payload(12.5));
    writer.close();
  }

  DiskContentCache reader(dir.path() / "store");
  reader.open();
  auto e = reader.get(fp, EntryKind::QUALITY_SCORE, "q1");
  REQUIRE(e.has_value());
  REQUIRE(*e->payload.score == Catch::Approx(12.5));
  REQUIRE(reader.put(fp, EntryKind::QUALITY_SCORE, "q1", score_payload(12.5)) ==
          PutResult::UNCHANGED);
}

TEST_CASE("disk_cache_layout_is_sharded_by_kind_and_prefix") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  const auto fp = fp_of("layout");
  const auto p = cache.entry_path(fp, EntryKind::QUALITY_SCORE);
  REQUIRE(p == dir.path() / "store" / "quality_score" / fp.substr(0, 2) / (fp + ".json"));
}

TEST_CASE("disk_cache_prune_removes_old_entries") {
  TempDir dir;
  int64_t now = 1000;
  DiskContentCache cache(dir.path() / "store", [&] { return now; });
  cache.open();

  const auto old_fp = fp_of("old");
  const auto new_fp = fp_of("new");
  cache.put(old_fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  now = 1000 + 86400 * 10;
  cache.put(new_fp, EntryKind::EMBEDDING, "v1", embedding_payload({2.0f}));

  REQUIRE(cache.prune(std::chrono::hours(24 * 5)) == 1);
  REQUIRE_FALSE(cache.get(old_fp, EntryKind::EMBEDDING, "v1").has_value());
  REQUIRE(cache.get(new_fp, EntryKind::EMBEDDING, "v1").has_value());
  REQUIRE(cache.prune(std::chrono::hours(24 * 5)) == 0);
}

TEST_CASE("disk_cache_open_fails_when_root_is_a_file") {
  TempDir dir;
  photo_triage::testing::write_file(dir / "blocker", "x");
  DiskContentCache cache(dir / "blocker");
  REQUIRE_THROWS_AS(cache.open(), CacheIOError);
}

TEST_CASE("disk_cache_put_before_open_throws") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  REQUIRE_THROWS_AS(cache.put(fp_of("x"), EntryKind::EMBEDDING, "v1", embedding_payload({1.0f})),
                    CacheIOError);
}

TEST_CASE("disk_cache_concurrent_writers_do_not_corrupt") {
  TempDir dir;
  DiskContentCache cache(dir.path() / "store");
  cache.open();

  std::vector<std::string> fps;
  for (int i = 0; i < 64; ++i) fps.push_back(fp_of("img-" + std::to_string(i)));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (size_t i = 0; i < fps.size(); ++i) {
        // every thread writes the same fingerprints; last write wins
        cache.put(fps[i], EntryKind::EMBEDDING, "v1",
                  embedding_payload({static_cast<float>(i), static_cast<float>(t % 2)}));
        cache.get(fps[(i + 7) % fps.size()], EntryKind::EMBEDDING, "v1");
      }
    });
  }
  for (auto& th : threads) th.join();

  for (size_t i = 0; i < fps.size(); ++i) {
    auto e = cache.get(fps[i], EntryKind::EMBEDDING, "v1");
    REQUIRE(e.has_value());
    REQUIRE(e->payload.values.size() == 2);
    REQUIRE(e->payload.values[0] == static_cast<float>(i));
  }
}

TEST_CASE("memory_cache_counts_hits_and_misses") {
  InMemoryContentCache cache;
  const auto fp = fp_of("mem");
  REQUIRE_FALSE(cache.get(fp, EntryKind::EMBEDDING, "v1").has_value());
  cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  REQUIRE(cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f})) ==
          PutResult::UNCHANGED);
  REQUIRE(cache.get(fp, EntryKind::EMBEDDING, "v1").has_value());
  REQUIRE_FALSE(cache.get(fp, EntryKind::EMBEDDING, "v2").has_value());

  REQUIRE(cache.hits() == 1);
  REQUIRE(cache.misses() == 2);
  REQUIRE(cache.writes() == 1);
  REQUIRE(cache.size() == 1);
}

TEST_CASE("memory_cache_prune_uses_clock") {
  int64_t now = 0;
  InMemoryContentCache cache([&] { return now; });
  cache.put(fp_of("a"), EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  now = 100;
  cache.put(fp_of("b"), EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  REQUIRE(cache.prune(std::chrono::seconds(50)) == 1);
  REQUIRE(cache.size() == 1);
}

TEST_CASE("null_cache_always_misses") {
  NullContentCache cache;
  const auto fp = fp_of("null");
  cache.put(fp, EntryKind::EMBEDDING, "v1", embedding_payload({1.0f}));
  REQUIRE_FALSE(cache.get(fp, EntryKind::EMBEDDING, "v1").has_value());
  REQUIRE_FALSE(cache.persistent());
}

TEST_CASE("fingerprint_depends_only_on_bytes") {
  TempDir dir;
  photo_triage::testing::write_file(dir / "a.jpg", "identical bytes");
  photo_triage::testing::write_file(dir / "renamed copy.png", "identical bytes");
  photo_triage::testing::write_file(dir / "other.jpg", "different bytes");

  using photo_triage::cache::fingerprint_file;
  REQUIRE(fingerprint_file(dir / "a.jpg") == fingerprint_file(dir / "renamed copy.png"));
  REQUIRE(fingerprint_file(dir / "a.jpg") != fingerprint_file(dir / "other.jpg"));
  REQUIRE(photo_triage::cache::is_valid_fingerprint(fingerprint_file(dir / "a.jpg")));
}

TEST_CASE("fingerprint_is_sha256_hex") {
  // sha256("abc")
  REQUIRE(fp_of("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("fingerprint_of_missing_file_throws_io_error") {
  TempDir dir;
  REQUIRE_THROWS_AS(photo_triage::cache::fingerprint_file(dir / "missing.jpg"),
                    photo_triage::IOError);
}
