#pragma once

#include "LivenessConfig.hpp"

#include <opencv2/core.hpp>

namespace prism {

/**
 * @brief Reason codes, checked in declaration order after DISABLED
 */
enum class QualityReason {
    PASS,
    DISABLED,
    ROI_TOO_SMALL,
    TOO_BLURRY,
    BAD_EXPOSURE,
    TOO_MUCH_MOTION
};

const char* to_string(QualityReason reason);

struct QualityFeatures {
    double motion_score = 0.0;            // Mean abs gray difference vs previous ROI
    double blur_variance = 0.0;           // Laplacian variance (low = blurry)
    double exposure_clip_fraction = 0.0;  // Pixels at or near sensor min/max
    int roi_min_dimension = 0;
};

struct QualityVerdict {
    bool passed = false;
    QualityReason reason = QualityReason::PASS;
    QualityFeatures features;
};

/**
 * @brief Quality Gate - first line of defense
 *
 * Scores the forehead ROI for usability. A failed verdict only keeps the
 * frame out of the rPPG buffer; spoof and physics checks run regardless.
 * Stateless: the caller owns the previous-ROI reference used for motion.
 */
class QualityGate {
public:
    explicit QualityGate(const LivenessConfig& config);

    /**
     * @brief Evaluate a forehead ROI
     * @param roi_gray Current forehead ROI, 8-bit grayscale
     * @param previous_gray Previous accepted forehead ROI (may be empty)
     */
    QualityVerdict evaluate(const cv::Mat& roi_gray, const cv::Mat& previous_gray) const;

    QualityFeatures compute_features(const cv::Mat& roi_gray, const cv::Mat& previous_gray) const;

private:
    LivenessConfig config_;
};

} // namespace prism
