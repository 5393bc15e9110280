#include "photo_triage/embedding/embedding_extractor.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"
#include "photo_triage/image/decode.hpp"

#include <opencv2/opencv.hpp>
#include <vector>

namespace photo_triage::embedding {

EmbeddingVector PerceptualHashExtractor::embed(const cv::Mat& bgr) {
    if (bgr.empty()) {
        throw ModelError("empty image");
    }

    cv::Mat small;
    cv::resize(image::to_gray(bgr), small, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

    cv::Mat f32;
    small.convertTo(f32, CV_32F);
    cv::Mat freq;
    cv::dct(f32, freq);

    cv::Mat low = freq(cv::Rect(0, 0, 8, 8)).clone();
    std::vector<float> coeffs(low.begin<float>(), low.end<float>());
    std::vector<float> tmp = coeffs;
    const float med = core::median_of(tmp);

    EmbeddingVector bits(64);
    for (int i = 0; i < 64; ++i) {
        bits[i] = coeffs[static_cast<size_t>(i)] > med ? 1.0f : 0.0f;
    }
    return bits;
}

} // namespace photo_triage::embedding
