#include "QualityGate.hpp"
#include "SignalProcessing.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace prism {

const char* to_string(QualityReason reason) {
    switch (reason) {
        case QualityReason::PASS:            return "pass";
        case QualityReason::DISABLED:        return "disabled";
        case QualityReason::ROI_TOO_SMALL:   return "roi_too_small";
        case QualityReason::TOO_BLURRY:      return "too_blurry";
        case QualityReason::BAD_EXPOSURE:    return "bad_exposure";
        case QualityReason::TOO_MUCH_MOTION: return "too_much_motion";
    }
    return "pass";
}

QualityGate::QualityGate(const LivenessConfig& config) : config_(config) {
}

QualityFeatures QualityGate::compute_features(const cv::Mat& roi_gray,
                                              const cv::Mat& previous_gray) const {
    QualityFeatures f;
    if (roi_gray.empty()) return f;

    f.roi_min_dimension = std::min(roi_gray.rows, roi_gray.cols);
    f.blur_variance = dsp::laplacian_variance(roi_gray);

    // Clipped pixels at either end of the sensor range
    cv::Mat low = roi_gray <= config_.exposure_low_level;
    cv::Mat high = roi_gray >= config_.exposure_high_level;
    const double clipped = cv::countNonZero(low) + cv::countNonZero(high);
    f.exposure_clip_fraction = clipped / static_cast<double>(roi_gray.total());

    // Motion only against a reference of identical geometry
    if (!previous_gray.empty() && previous_gray.size() == roi_gray.size() &&
        previous_gray.type() == roi_gray.type()) {
        cv::Mat diff;
        cv::absdiff(roi_gray, previous_gray, diff);
        f.motion_score = cv::mean(diff)[0];
    }
    return f;
}

QualityVerdict QualityGate::evaluate(const cv::Mat& roi_gray, const cv::Mat& previous_gray) const {
    QualityVerdict v;
    v.features = compute_features(roi_gray, previous_gray);

    if (!config_.enable_quality_gate) {
        v.passed = true;
        v.reason = QualityReason::DISABLED;
        return v;
    }

    if (v.features.roi_min_dimension < config_.min_roi_size) {
        v.reason = QualityReason::ROI_TOO_SMALL;
    } else if (v.features.blur_variance < config_.min_blur_variance) {
        v.reason = QualityReason::TOO_BLURRY;
    } else if (v.features.exposure_clip_fraction > config_.max_exposure_clip_fraction) {
        v.reason = QualityReason::BAD_EXPOSURE;
    } else if (v.features.motion_score > config_.max_motion_score) {
        v.reason = QualityReason::TOO_MUCH_MOTION;
    } else {
        v.passed = true;
        v.reason = QualityReason::PASS;
    }
    return v;
}

} // namespace prism
