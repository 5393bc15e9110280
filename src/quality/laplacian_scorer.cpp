#include "photo_triage/quality/quality_scorer.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/image/decode.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <sstream>

namespace photo_triage::quality {

double max_patch_laplacian_variance(const cv::Mat& gray, int patch_size) {
    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);

    const int ph = std::min(patch_size, lap.rows);
    const int pw = std::min(patch_size, lap.cols);
    const int step_y = std::max(1, ph / 2);
    const int step_x = std::max(1, pw / 2);

    double best = 0.0;
    for (int y = 0; y + ph <= lap.rows; y += step_y) {
        for (int x = 0; x + pw <= lap.cols; x += step_x) {
            cv::Scalar mean, stddev;
            cv::meanStdDev(lap(cv::Rect(x, y, pw, ph)), mean, stddev);
            best = std::max(best, stddev[0] * stddev[0]);
        }
    }
    return best;
}

LaplacianPatchScorer::LaplacianPatchScorer(const LaplacianOptions& opt) : opt_(opt) {
    if (opt_.patch_size < 8) {
        throw ModelError("laplacian patch size too small");
    }
    if (!(opt_.reference > 0.0f)) {
        throw ModelError("laplacian reference must be > 0");
    }
}

std::string LaplacianPatchScorer::producer_version() const {
    std::ostringstream oss;
    oss << "laplacian-v1:p" << opt_.patch_size << ":r" << opt_.reference << "@" << opt_.max_dimension;
    return oss.str();
}

QualityMeasurement LaplacianPatchScorer::score(const cv::Mat& bgr) {
    if (bgr.empty()) {
        throw ModelError("empty image");
    }
    cv::Mat gray = image::to_gray(image::downscale_to_max(bgr, opt_.max_dimension));

    const double max_var = max_patch_laplacian_variance(gray, opt_.patch_size);
    const double ref = static_cast<double>(opt_.reference);

    const Matrix2Df px = image::gray_to_matrix(gray);
    const double n = static_cast<double>(std::max<Eigen::Index>(1, px.size()));
    const double blacks = static_cast<double>((px.array() < 10.0f).count()) / n;
    const double whites = static_cast<double>((px.array() > 245.0f).count()) / n;

    QualityMeasurement m;
    m.score = 100.0 * ref / (ref + max_var);
    m.metadata["max_laplacian_variance"] = max_var;
    m.metadata["blacks"] = blacks;
    m.metadata["whites"] = whites;
    return m;
}

} // namespace photo_triage::quality
