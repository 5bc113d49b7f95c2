#pragma once

#include "FrameBox.hpp"
#include "LivenessConfig.hpp"

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace prism {

struct SubsurfaceResult {
    bool evaluated = false;
    std::optional<double> ratio;      // Blue / red edge sharpness
    double red_sharpness = 0.0;
    double blue_sharpness = 0.0;
    bool passed = false;
};

/**
 * @brief Pupil center and corneal glint of one eye (face ROI coordinates)
 */
struct EyeObservation {
    cv::Point2f pupil;
    cv::Point2f glint;
};

struct CornealSample {
    double timestamp_ms = 0.0;
    std::optional<EyeObservation> left;
    std::optional<EyeObservation> right;
};

struct CornealResult {
    bool evaluated = false;
    std::optional<double> decoupling;   // 1 - |corr(pupil motion, glint motion)|
    std::optional<double> symmetry;     // Left/right glint agreement, 0-1
    double pupil_motion_px = 0.0;
    bool passed = false;
    bool symmetry_passed = false;
};

struct ChromaResult {
    bool passed = false;
    cv::Vec3d face_mean_rgb;
};

/**
 * @brief Frame-local physical plausibility checks
 *
 * - Subsurface scattering: red light diffuses under skin, so red edges are
 *   softer than blue edges along a shadow boundary. Print and screens are
 *   opaque and give a ratio near 1.
 * - Corneal: a real cornea keeps its glint roughly fixed while the pupil
 *   rotates; a flat reproduction moves both together.
 * - Chroma: the face reflects the displayed stimulus color.
 */
class PhysicsProbes {
public:
    explicit PhysicsProbes(const LivenessConfig& config);

    /**
     * @brief Red/blue sharpness ratio along the shadow boundary
     *
     * Only evaluated under WHITE, RED or BLUE stimulus.
     */
    SubsurfaceResult probe_subsurface(const FrameBox& frame) const;

    /**
     * @brief Pupil and glint for one eye
     *
     * Uses locator-provided points when present, otherwise the darkest
     * (pupil) and brightest (glint) points of the blurred eye patch.
     */
    std::optional<EyeObservation> locate_eye(const cv::Mat& face_bgr, const EyeRegion& eye) const;

    /**
     * @brief Decoupling and symmetry over a trajectory window (oldest first)
     */
    CornealResult probe_corneal(const std::vector<CornealSample>& window) const;

    ChromaResult check_chroma(const cv::Mat& face_bgr, StimulusColor stimulus) const;

    /**
     * @brief Shadow boundary region used by the subsurface probe
     */
    static cv::Rect shadow_region(const FrameBox& frame);

private:
    LivenessConfig config_;
};

} // namespace prism
