#include "photo_triage/embedding/embedding_extractor.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>

namespace photo_triage::embedding {

namespace {

const cv::Scalar kClipMean(0.48145466, 0.4578275, 0.40821073);
const cv::Scalar kClipStd(0.26862954, 0.26130258, 0.27577711);

} // namespace

void l2_normalize(EmbeddingVector& v) {
    const float n = v.norm();
    if (n > 1e-12f) {
        v /= n;
    }
}

DnnEmbeddingExtractor::DnnEmbeddingExtractor(const DnnEmbeddingOptions& opt) : opt_(opt) {
    if (opt_.model_path.empty()) {
        throw ModelError("no embedding model configured");
    }
    if (opt_.input_size < 32) {
        throw ModelError("embedding input size too small: " + std::to_string(opt_.input_size));
    }

    try {
        net_ = cv::dnn::readNet(opt_.model_path);
    } catch (const cv::Exception& e) {
        throw ModelError("cannot load " + opt_.model_path + ": " + e.what());
    }
    if (net_.empty()) {
        throw ModelError("cannot load " + opt_.model_path);
    }
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

    try {
        model_digest_ = core::sha256_file(opt_.model_path).substr(0, 16);
    } catch (const IOError& e) {
        throw ModelError(std::string("cannot hash model file: ") + e.what());
    }
}

std::string DnnEmbeddingExtractor::producer_version() const {
    return opt_.model_version + "-" + model_digest_ + "@" + std::to_string(opt_.input_size);
}

cv::Mat DnnEmbeddingExtractor::preprocess(const cv::Mat& bgr) const {
    const int s = opt_.input_size;
    const int shortest = std::min(bgr.rows, bgr.cols);
    if (shortest <= 0) {
        throw ModelError("empty image");
    }

    const double f = static_cast<double>(s) / static_cast<double>(shortest);
    const int w = std::max(s, static_cast<int>(std::lround(bgr.cols * f)));
    const int h = std::max(s, static_cast<int>(std::lround(bgr.rows * f)));

    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(w, h), 0, 0, cv::INTER_CUBIC);

    const cv::Rect crop((w - s) / 2, (h - s) / 2, s, s);
    cv::Mat rgb;
    cv::cvtColor(resized(crop), rgb, cv::COLOR_BGR2RGB);

    cv::Mat f32;
    rgb.convertTo(f32, CV_32F, 1.0 / 255.0);
    cv::subtract(f32, kClipMean, f32);
    cv::divide(f32, kClipStd, f32);

    return cv::dnn::blobFromImage(f32);
}

EmbeddingVector DnnEmbeddingExtractor::embed(const cv::Mat& bgr) {
    cv::Mat blob = preprocess(bgr);

    cv::Mat out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        try {
            net_.setInput(blob);
            out = net_.forward().clone();
        } catch (const cv::Exception& e) {
            throw ModelError(std::string("forward failed: ") + e.what());
        }
    }

    if (out.empty() || out.depth() != CV_32F) {
        throw ModelError("unexpected embedding output");
    }
    out = out.reshape(1, 1);

    EmbeddingVector v(out.cols);
    const float* p = out.ptr<float>(0);
    for (int i = 0; i < out.cols; ++i) {
        v[i] = p[i];
    }
    if (!v.allFinite()) {
        throw ModelError("embedding contains non-finite values");
    }
    l2_normalize(v);
    dim_.store(static_cast<int>(v.size()));
    return v;
}

} // namespace photo_triage::embedding
