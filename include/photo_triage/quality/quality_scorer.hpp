#pragma once

#include "photo_triage/core/types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>
#include <string>

namespace photo_triage::quality {

// No-reference distortion score. Lower is better. Deterministic, no network.
class QualityScorer {
public:
  virtual ~QualityScorer() = default;

  virtual QualityMeasurement score(const cv::Mat &bgr) = 0;
  virtual std::string producer_version() const = 0;
  virtual std::string name() const = 0;
};

struct BrisqueOptions {
  std::string model_path;
  std::string range_path;
  int max_dimension = 1024;
};

// BRISQUE via opencv_contrib quality. The SVM model and the feature range
// are loaded once; every call uses its own QualityBRISQUE instance.
class BrisqueScorer : public QualityScorer {
public:
  // Throws ModelError when the model or range file cannot be loaded.
  explicit BrisqueScorer(const BrisqueOptions &opt);

  QualityMeasurement score(const cv::Mat &bgr) override;
  std::string producer_version() const override;
  std::string name() const override { return "brisque"; }

private:
  BrisqueOptions opt_;
  cv::Ptr<cv::ml::SVM> model_;
  cv::Mat range_;
};

struct LaplacianOptions {
  int patch_size = 256;
  float reference = 40.0f;
  int max_dimension = 1024;
};

// Sharpness of the sharpest region: maximum Laplacian variance over
// half-overlapping patches, mapped to 100 * ref / (ref + max_variance).
class LaplacianPatchScorer : public QualityScorer {
public:
  explicit LaplacianPatchScorer(const LaplacianOptions &opt);

  QualityMeasurement score(const cv::Mat &bgr) override;
  std::string producer_version() const override;
  std::string name() const override { return "laplacian"; }

private:
  LaplacianOptions opt_;
};

// Maximum Laplacian variance over patch_size windows with stride patch_size/2.
double max_patch_laplacian_variance(const cv::Mat &gray, int patch_size);

} // namespace photo_triage::quality
