#include "photo_triage/image/decode.hpp"
#include "photo_triage/core/errors.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>

namespace photo_triage::image {

cv::Mat decode_image(const std::vector<uint8_t>& bytes, const std::string& source) {
    if (bytes.empty()) {
        throw DecodeError("empty file: " + source);
    }

    cv::Mat img;
    try {
        img = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError(source + ": " + e.what());
    }
    if (img.empty()) {
        throw DecodeError("unsupported or corrupt image: " + source);
    }
    return img;
}

cv::Mat downscale_to_max(const cv::Mat& img, int max_dimension) {
    const int longer = std::max(img.rows, img.cols);
    if (max_dimension <= 0 || longer <= max_dimension) {
        return img;
    }

    const double f = static_cast<double>(max_dimension) / static_cast<double>(longer);
    const int w = std::max(1, static_cast<int>(std::lround(img.cols * f)));
    const int h = std::max(1, static_cast<int>(std::lround(img.rows * f)));

    cv::Mat out;
    cv::resize(img, out, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    return out;
}

cv::Mat to_gray(const cv::Mat& img) {
    if (img.channels() == 1) {
        return img;
    }
    cv::Mat gray;
    if (img.channels() == 4) {
        cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

Matrix2Df gray_to_matrix(const cv::Mat& gray) {
    cv::Mat f32;
    gray.convertTo(f32, CV_32F);

    Matrix2Df out(f32.rows, f32.cols);
    for (int y = 0; y < f32.rows; ++y) {
        const float* row = f32.ptr<float>(y);
        std::copy(row, row + f32.cols, out.data() + static_cast<Eigen::Index>(y) * f32.cols);
    }
    return out;
}

} // namespace photo_triage::image
