#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"
#include "test_support.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace photo_triage;

TEST_CASE("slugify_lowercases_and_joins_words") {
  REQUIRE(core::slugify("Golden Hour Beach") == "golden-hour-beach");
  REQUIRE(core::slugify("  street__portrait!! ") == "street-portrait");
  REQUIRE(core::slugify("one two three four five six") == "one-two-three-four");
  REQUIRE(core::slugify("one two three", 2) == "one-two");
  REQUIRE(core::slugify("???").empty());
}

TEST_CASE("glob_match_is_case_insensitive") {
  REQUIRE(core::glob_match("*.jpg", "IMG_0001.JPG"));
  REQUIRE(core::glob_match("IMG_????.png", "img_0042.png"));
  REQUIRE_FALSE(core::glob_match("*.jpg", "IMG_0001.jpeg"));
  REQUIRE_FALSE(core::glob_match("*.png", "notes.png.txt"));
}

TEST_CASE("discover_images_filters_and_sorts") {
  testing::TempDir dir;
  testing::write_file(dir / "b.JPG", "x");
  testing::write_file(dir / "a.png", "x");
  testing::write_file(dir / "notes.txt", "x");
  testing::write_file(dir / ".hidden.jpg", "x");
  fs::create_directories(dir / "sub.jpg");

  auto found = core::discover_images(dir.path(), "*.jpg; *.png");
  REQUIRE(found.size() == 2);
  REQUIRE(found[0].filename() == "a.png");
  REQUIRE(found[1].filename() == "b.JPG");

  REQUIRE(core::discover_images(dir / "missing", "*.jpg").empty());
}

TEST_CASE("base64_encode_matches_rfc4648_vectors") {
  auto enc = [](const std::string& s) {
    return core::base64_encode(std::vector<uint8_t>(s.begin(), s.end()));
  };
  REQUIRE(enc("").empty());
  REQUIRE(enc("f") == "Zg==");
  REQUIRE(enc("fo") == "Zm8=");
  REQUIRE(enc("abc") == "YWJj");
  REQUIRE(enc("foobar") == "Zm9vYmFy");
}

TEST_CASE("sha256_bytes_known_vector") {
  const std::string s = "abc";
  REQUIRE(core::sha256_bytes(std::vector<uint8_t>(s.begin(), s.end())) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("trim_split_join") {
  REQUIRE(core::trim("  a b \n") == "a b");
  REQUIRE(core::trim("   ").empty());
  auto parts = core::split("a;b;;c", ';');
  REQUIRE(parts.size() == 4);
  REQUIRE(parts[2].empty());
  REQUIRE(core::join({"x", "y", "z"}, "-") == "x-y-z");
  REQUIRE(core::starts_with("photo_triage", "photo"));
  REQUIRE(core::ends_with("photo_triage", "triage"));
  REQUIRE(core::to_lower("KeEp") == "keep");
}

TEST_CASE("median_of_odd_and_even") {
  std::vector<float> odd{5.0f, 1.0f, 3.0f};
  REQUIRE(core::median_of(odd) == Catch::Approx(3.0f));

  std::vector<float> even{4.0f, 1.0f, 3.0f, 2.0f};
  REQUIRE(core::median_of(even) == Catch::Approx(2.5f));

  std::vector<float> empty;
  REQUIRE(core::median_of(empty) == Catch::Approx(0.0f));
}

TEST_CASE("write_text_atomic_replaces_content") {
  testing::TempDir dir;
  const fs::path p = dir / "report.json";
  core::write_text_atomic(p, "first");
  core::write_text_atomic(p, "second");
  REQUIRE(core::read_text(p) == "second");

  size_t files = 0;
  for (const auto& e : fs::directory_iterator(dir.path())) {
    (void)e;
    ++files;
  }
  REQUIRE(files == 1);
}

TEST_CASE("read_bytes_missing_file_is_io_error") {
  testing::TempDir dir;
  REQUIRE_THROWS_AS(core::read_bytes(dir / "nope.jpg"), IOError);
}

TEST_CASE("run_id_is_unique") {
  REQUIRE(core::get_run_id() != core::get_run_id());
}
