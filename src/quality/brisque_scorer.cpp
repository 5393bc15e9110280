#include "photo_triage/quality/quality_scorer.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/image/decode.hpp"

#include <opencv2/opencv.hpp>
#include <opencv2/quality.hpp>
#include <cmath>
#include <filesystem>

namespace photo_triage::quality {

BrisqueScorer::BrisqueScorer(const BrisqueOptions& opt) : opt_(opt) {
    namespace fs = std::filesystem;
    if (!fs::exists(opt_.model_path)) {
        throw ModelError("BRISQUE model not found: " + opt_.model_path);
    }
    if (!fs::exists(opt_.range_path)) {
        throw ModelError("BRISQUE range not found: " + opt_.range_path);
    }

    try {
        model_ = cv::ml::SVM::load(opt_.model_path);
        cv::FileStorage fs_range(opt_.range_path, cv::FileStorage::READ);
        if (fs_range.isOpened()) {
            range_ = fs_range.getFirstTopLevelNode().mat();
        }
    } catch (const cv::Exception& e) {
        throw ModelError(std::string("cannot load BRISQUE data: ") + e.what());
    }

    if (model_.empty() || model_->empty()) {
        throw ModelError("BRISQUE model is empty: " + opt_.model_path);
    }
    if (range_.empty()) {
        throw ModelError("BRISQUE range is empty: " + opt_.range_path);
    }
}

std::string BrisqueScorer::producer_version() const {
    return "brisque:" + std::filesystem::path(opt_.model_path).filename().string() + "@" +
           std::to_string(opt_.max_dimension);
}

QualityMeasurement BrisqueScorer::score(const cv::Mat& bgr) {
    if (bgr.empty()) {
        throw ModelError("empty image");
    }
    cv::Mat img = image::downscale_to_max(bgr, opt_.max_dimension);

    double s = 0.0;
    try {
        auto brisque = cv::quality::QualityBRISQUE::create(model_, range_);
        s = brisque->compute(img)[0];
    } catch (const cv::Exception& e) {
        throw ModelError(std::string("BRISQUE failed: ") + e.what());
    }
    if (!std::isfinite(s)) {
        throw ModelError("BRISQUE returned a non-finite score");
    }

    QualityMeasurement m;
    m.score = s;
    m.metadata["width"] = img.cols;
    m.metadata["height"] = img.rows;
    return m;
}

} // namespace photo_triage::quality
