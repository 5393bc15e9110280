#include "photo_triage/core/errors.hpp"
#include "photo_triage/image/decode.hpp"
#include "photo_triage/quality/quality_scorer.hpp"
#include "photo_triage/quality/tiering.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace photo_triage;
using quality::TierThresholds;

namespace {

cv::Mat checkerboard(int size, int square) {
  cv::Mat img(size, size, CV_8UC3);
  for (int y = 0; y < size; ++y) {
    for (int x = 0; x < size; ++x) {
      const bool on = ((x / square) + (y / square)) % 2 == 0;
      img.at<cv::Vec3b>(y, x) = on ? cv::Vec3b(255, 255, 255) : cv::Vec3b(0, 0, 0);
    }
  }
  return img;
}

StructuredVerdict keep_verdict() {
  StructuredVerdict v;
  v.decision = Stage2Decision::KEEP;
  v.label = "harbour-at-dusk";
  return v;
}

} // namespace

TEST_CASE("classify_stage1_boundaries_are_inclusive") {
  TierThresholds t;
  REQUIRE(quality::classify_stage1(0.0, t) == Stage1Tier::KEEPER);
  REQUIRE(quality::classify_stage1(35.0, t) == Stage1Tier::KEEPER);
  REQUIRE(quality::classify_stage1(35.01, t) == Stage1Tier::AMBIGUOUS);
  REQUIRE(quality::classify_stage1(42.0, t) == Stage1Tier::AMBIGUOUS);
  REQUIRE(quality::classify_stage1(49.99, t) == Stage1Tier::AMBIGUOUS);
  REQUIRE(quality::classify_stage1(50.0, t) == Stage1Tier::DUD);
  REQUIRE(quality::classify_stage1(120.0, t) == Stage1Tier::DUD);
}

TEST_CASE("classify_stage1_equal_thresholds_have_no_ambiguous_band") {
  TierThresholds t{40.0, 40.0};
  REQUIRE(quality::classify_stage1(40.0, t) == Stage1Tier::KEEPER);
  REQUIRE(quality::classify_stage1(40.5, t) == Stage1Tier::DUD);
}

TEST_CASE("resolve_verdict_ambiguous_with_stage2_is_escalated") {
  auto v = quality::resolve_verdict(42.0, TierThresholds{}, keep_verdict());
  REQUIRE(v.stage1_tier == Stage1Tier::AMBIGUOUS);
  REQUIRE(v.tier == VerdictTier::AMBIGUOUS_ESCALATED);
  REQUIRE(v.stage2.has_value());
  REQUIRE(v.stage2->label == "harbour-at-dusk");
  REQUIRE_FALSE(v.needs_review);
}

TEST_CASE("resolve_verdict_ambiguous_without_stage2_needs_review") {
  auto v = quality::resolve_verdict(42.0, TierThresholds{}, std::nullopt);
  REQUIRE(v.tier == VerdictTier::NEEDS_REVIEW);
  REQUIRE(v.needs_review);
  REQUIRE_FALSE(v.stage2.has_value());
  REQUIRE(v.stage1_score == Catch::Approx(42.0));
}

TEST_CASE("resolve_verdict_ignores_stage2_outside_ambiguous_band") {
  auto keeper = quality::resolve_verdict(20.0, TierThresholds{}, keep_verdict());
  REQUIRE(keeper.tier == VerdictTier::KEEPER);
  REQUIRE_FALSE(keeper.stage2.has_value());

  auto dud = quality::resolve_verdict(75.0, TierThresholds{}, keep_verdict());
  REQUIRE(dud.tier == VerdictTier::DUD);
  REQUIRE_FALSE(dud.stage2.has_value());
  REQUIRE_FALSE(dud.needs_review);
}

TEST_CASE("laplacian_scorer_ranks_sharp_image_better_than_blurred") {
  cv::Mat sharp = checkerboard(128, 8);
  cv::Mat blurred;
  cv::GaussianBlur(sharp, blurred, cv::Size(15, 15), 5.0);

  quality::LaplacianOptions opt;
  opt.patch_size = 32;
  quality::LaplacianPatchScorer scorer(opt);

  auto s_sharp = scorer.score(sharp);
  auto s_blur = scorer.score(blurred);
  REQUIRE(s_sharp.score < s_blur.score);
  REQUIRE(s_sharp.score > 0.0);
  REQUIRE(s_blur.score <= 100.0);
}

TEST_CASE("laplacian_scorer_flat_image_scores_worst") {
  cv::Mat flat(64, 64, CV_8UC3, cv::Scalar(128, 128, 128));
  quality::LaplacianOptions opt;
  opt.patch_size = 16;
  quality::LaplacianPatchScorer scorer(opt);

  auto m = scorer.score(flat);
  REQUIRE(m.score == Catch::Approx(100.0));
  REQUIRE(m.metadata["max_laplacian_variance"].get<double>() == Catch::Approx(0.0));
}

TEST_CASE("laplacian_scorer_reports_clipped_pixel_fractions") {
  cv::Mat img(64, 64, CV_8UC3, cv::Scalar(0, 0, 0));
  img(cv::Rect(0, 0, 64, 16)).setTo(cv::Scalar(255, 255, 255));

  quality::LaplacianPatchScorer scorer(quality::LaplacianOptions{});
  auto m = scorer.score(img);
  REQUIRE(m.metadata["whites"].get<double>() == Catch::Approx(0.25));
  REQUIRE(m.metadata["blacks"].get<double>() == Catch::Approx(0.75));
}

TEST_CASE("laplacian_scorer_is_deterministic") {
  cv::Mat img = checkerboard(96, 6);
  quality::LaplacianPatchScorer scorer(quality::LaplacianOptions{});
  REQUIRE(scorer.score(img).score == scorer.score(img).score);
}

TEST_CASE("laplacian_scorer_rejects_bad_options") {
  quality::LaplacianOptions opt;
  opt.patch_size = 4;
  REQUIRE_THROWS_AS(quality::LaplacianPatchScorer(opt), ModelError);

  opt = quality::LaplacianOptions{};
  opt.reference = 0.0f;
  REQUIRE_THROWS_AS(quality::LaplacianPatchScorer(opt), ModelError);
}

TEST_CASE("brisque_scorer_missing_model_is_model_error") {
  quality::BrisqueOptions opt;
  opt.model_path = "/nonexistent/brisque_model_live.yml";
  opt.range_path = "/nonexistent/brisque_range_live.yml";
  REQUIRE_THROWS_AS(quality::BrisqueScorer(opt), ModelError);
}

TEST_CASE("decode_image_rejects_garbage_and_empty_input") {
  const std::string text = "definitely not a jpeg";
  std::vector<uint8_t> garbage(text.begin(), text.end());
  REQUIRE_THROWS_AS(image::decode_image(garbage, "garbage.jpg"), DecodeError);
  REQUIRE_THROWS_AS(image::decode_image({}, "empty.jpg"), DecodeError);
}

TEST_CASE("decode_image_reads_encoded_png") {
  cv::Mat src(20, 30, CV_8UC3, cv::Scalar(10, 20, 30));
  std::vector<uint8_t> png;
  REQUIRE(cv::imencode(".png", src, png));

  cv::Mat img = image::decode_image(png, "in-memory.png");
  REQUIRE(img.rows == 20);
  REQUIRE(img.cols == 30);
  REQUIRE(img.type() == CV_8UC3);
  REQUIRE(img.at<cv::Vec3b>(5, 5) == cv::Vec3b(10, 20, 30));
}

TEST_CASE("downscale_to_max_keeps_aspect_and_never_upscales") {
  cv::Mat wide(100, 400, CV_8UC3, cv::Scalar::all(0));
  cv::Mat small = image::downscale_to_max(wide, 200);
  REQUIRE(small.cols == 200);
  REQUIRE(small.rows == 50);

  cv::Mat same = image::downscale_to_max(wide, 1000);
  REQUIRE(same.cols == 400);
  REQUIRE(same.rows == 100);
}

TEST_CASE("gray_to_matrix_preserves_pixel_values") {
  cv::Mat gray(2, 3, CV_8UC1, cv::Scalar(7));
  gray.at<uint8_t>(1, 2) = 200;
  Matrix2Df m = image::gray_to_matrix(gray);
  REQUIRE(m.rows() == 2);
  REQUIRE(m.cols() == 3);
  REQUIRE(m(0, 0) == Catch::Approx(7.0f));
  REQUIRE(m(1, 2) == Catch::Approx(200.0f));
}
