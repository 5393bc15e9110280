#pragma once

#include "photo_triage/core/types.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace photo_triage::image {

// Decodes encoded image bytes into an 8-bit BGR image.
// Throws DecodeError when the bytes are not a decodable image.
cv::Mat decode_image(const std::vector<uint8_t>& bytes, const std::string& source);

// Shrinks so that the longer side is at most max_dimension. Never upscales.
cv::Mat downscale_to_max(const cv::Mat& img, int max_dimension);

cv::Mat to_gray(const cv::Mat& img);

// 8-bit grayscale image as a float matrix (values 0..255).
Matrix2Df gray_to_matrix(const cv::Mat& gray);

} // namespace photo_triage::image
