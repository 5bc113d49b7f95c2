#pragma once

#include "FrameBox.hpp"
#include "LivenessConfig.hpp"

#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace prism {

/**
 * @brief Forehead mean green level of one frame, kept for every valid frame
 */
struct GreenSample {
    double timestamp_ms = 0.0;
    double value = 0.0;
};

struct TextureResult {
    double local_std = 0.0;
    double uniformity = 0.0;
    bool detected = false;
};

struct FlickerResult {
    bool evaluated = false;
    double ratio = 0.0;   // Amplitude above flicker_min_hz / amplitude in the cardiac band
    bool detected = false;
};

struct MoireResult {
    bool evaluated = false;
    double score = 0.0;
    bool detected = false;
};

struct VarianceResult {
    bool evaluated = false;
    double signal_variance = 0.0;   // Coefficient of variation, percent
    bool is_static = false;
    bool lighting_unstable = false;
};

struct GeometryResult {
    bool valid = true;
    std::string detail;
};

/**
 * @brief Screen / print / replay detection
 *
 * Texture and geometry are hard gates. Flicker, moire and lighting
 * instability are penalties; the static-image check is a hard gate
 * unless disabled in the config.
 */
class SpoofDetector {
public:
    explicit SpoofDetector(const LivenessConfig& config);

    /**
     * @brief Micro-texture uniformity of the face
     *
     * Skin has fine high-frequency variation; screens and prints are smooth.
     */
    TextureResult check_texture(const cv::Mat& face_gray) const;

    /**
     * @brief High-frequency energy in the brightness series vs the cardiac band
     */
    FlickerResult check_flicker(const std::vector<GreenSample>& series) const;

    /**
     * @brief Periodic peaks in the 2-D spectrum (pixel grid interference)
     */
    MoireResult check_moire(const cv::Mat& face_gray) const;

    /**
     * @brief Temporal variance of the brightness series (photo vs living tissue)
     */
    VarianceResult check_variance(const std::vector<GreenSample>& series) const;

    GeometryResult check_geometry(const FrameBox& frame) const;

private:
    LivenessConfig config_;
};

} // namespace prism
