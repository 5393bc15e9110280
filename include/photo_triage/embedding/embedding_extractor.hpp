#pragma once

#include "photo_triage/core/types.hpp"

#include <atomic>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <string>

namespace photo_triage::embedding {

class EmbeddingExtractor {
public:
  virtual ~EmbeddingExtractor() = default;

  // Throws ModelError when inference fails.
  virtual EmbeddingVector embed(const cv::Mat &bgr) = 0;

  // Cache key component. Changes whenever the output would change.
  virtual std::string producer_version() const = 0;
  virtual std::string name() const = 0;

  // Length of embed() output, 0 while not yet known.
  virtual int dimension() const { return 0; }
};

struct DnnEmbeddingOptions {
  std::string model_path;     // ONNX image encoder, hashed into producer_version()
  std::string model_version = "clip-vit-b-32";
  int input_size = 224;
};

// CLIP-style image encoder run through OpenCV DNN on the CPU.
// forward() is serialized, so one instance can be shared by all workers.
class DnnEmbeddingExtractor : public EmbeddingExtractor {
public:
  // Throws ModelError when the network cannot be loaded.
  explicit DnnEmbeddingExtractor(const DnnEmbeddingOptions &opt);

  EmbeddingVector embed(const cv::Mat &bgr) override;
  std::string producer_version() const override;
  std::string name() const override { return "clip"; }
  int dimension() const override { return dim_.load(); }

  // Resize (shortest side), center crop, RGB, CLIP mean/std. NCHW blob.
  cv::Mat preprocess(const cv::Mat &bgr) const;

private:
  DnnEmbeddingOptions opt_;
  std::string model_digest_;
  std::atomic<int> dim_{0};
  std::mutex mtx_;
  cv::dnn::Net net_;
};

// 64-bit DCT perceptual hash returned as a 0/1 vector.
class PerceptualHashExtractor : public EmbeddingExtractor {
public:
  EmbeddingVector embed(const cv::Mat &bgr) override;
  std::string producer_version() const override { return "phash-dct-8x8-v1"; }
  std::string name() const override { return "phash"; }
  int dimension() const override { return 64; }
};

void l2_normalize(EmbeddingVector &v);

} // namespace photo_triage::embedding
