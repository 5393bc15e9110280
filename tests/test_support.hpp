#pragma once

#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/types.hpp"
#include "photo_triage/embedding/embedding_extractor.hpp"
#include "photo_triage/escalation/escalation.hpp"
#include "photo_triage/quality/quality_scorer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace photo_triage::testing {

namespace fs = std::filesystem;

class TempDir {
public:
  explicit TempDir(const std::string& prefix = "photo_triage_test") {
    std::random_device rd;
    path_ = fs::temp_directory_path() /
            (prefix + "_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  fs::path operator/(const std::string& name) const { return path_ / name; }

private:
  fs::path path_;
};

// 32x32 solid image; pixel (0,0) green channel carries `marker`.
inline fs::path write_png(const fs::path& path, cv::Scalar bgr, int marker) {
  cv::Mat img(32, 32, CV_8UC3, bgr);
  img.at<cv::Vec3b>(0, 0)[1] = static_cast<uint8_t>(marker);
  cv::imwrite(path.string(), img);
  return path;
}

inline void write_file(const fs::path& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

// Embedding = mean BGR color.
class FakeExtractor : public embedding::EmbeddingExtractor {
public:
  EmbeddingVector embed(const cv::Mat& bgr) override {
    calls.fetch_add(1);
    cv::Scalar m = cv::mean(bgr);
    EmbeddingVector v(3);
    v << static_cast<float>(m[0]), static_cast<float>(m[1]), static_cast<float>(m[2]);
    return v;
  }
  std::string producer_version() const override { return "fake-mean-color-v1"; }
  std::string name() const override { return "fake"; }
  int dimension() const override { return reported_dimension; }

  std::atomic<int> calls{0};
  int reported_dimension = 3;
};

// Score = green channel of pixel (0,0).
class FakeScorer : public quality::QualityScorer {
public:
  QualityMeasurement score(const cv::Mat& bgr) override {
    calls.fetch_add(1);
    QualityMeasurement m;
    m.score = static_cast<double>(bgr.at<cv::Vec3b>(0, 0)[1]);
    return m;
  }
  std::string producer_version() const override { return "fake-marker-v1"; }
  std::string name() const override { return "fake"; }

  std::atomic<int> calls{0};
};

enum class VlmBehavior {
  KEEP,
  REJECT,
  TIMEOUT,
  UNAVAILABLE,
  GARBAGE,
  FAIL_ONCE_THEN_KEEP
};

class FakeVisionClient : public escalation::VisionLanguageClient {
public:
  explicit FakeVisionClient(VlmBehavior behavior) : behavior_(behavior) {}

  std::string analyze(const std::vector<uint8_t>& image_bytes,
                      const std::string& instruction) override {
    const int n = calls.fetch_add(1) + 1;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      payload_sizes.push_back(image_bytes.size());
      instructions.push_back(instruction);
    }
    switch (behavior_) {
      case VlmBehavior::KEEP:
        return R"({"decision": "keep", "label": "Red Square Study", "critique": "Flat but sharp."})";
      case VlmBehavior::REJECT:
        return R"({"decision": "reject", "label": "blurry-red-square", "critique": null})";
      case VlmBehavior::TIMEOUT:
        throw EscalationTimeout("fake timeout");
      case VlmBehavior::UNAVAILABLE:
        throw EscalationUnavailable("fake service down");
      case VlmBehavior::GARBAGE:
        return "I think this photo is nice";
      case VlmBehavior::FAIL_ONCE_THEN_KEEP:
        if (n == 1) throw EscalationUnavailable("first call fails");
        return R"({"decision": "keep", "label": "second-try"})";
    }
    return "";
  }
  std::string describe() const override { return "fake"; }

  std::atomic<int> calls{0};
  std::vector<size_t> payload_sizes;
  std::vector<std::string> instructions;

private:
  VlmBehavior behavior_;
  std::mutex mutex_;
};

} // namespace photo_triage::testing
