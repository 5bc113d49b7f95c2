#pragma once

/**
 * @file FrameBox.hpp
 * @brief One submitted frame: face + forehead ROIs, displayed stimulus, timestamp
 *
 * ROI coordinates come from an external face locator. The engine never
 * detects faces itself; it only consumes what the locator provides.
 */

#include <cstdint>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace prism {

/**
 * @brief On-screen stimulus palette
 */
enum class StimulusColor {
    NONE,
    RED,
    GREEN,
    BLUE,
    WHITE
};

const char* to_string(StimulusColor color);

/**
 * @brief Parse a stimulus label (case-insensitive)
 * @return std::nullopt for labels outside the palette
 */
std::optional<StimulusColor> parse_stimulus(const std::string& label);

/**
 * @brief Unit RGB of the displayed color (NONE = black)
 */
cv::Vec3d stimulus_rgb(StimulusColor color);

/**
 * @brief Luminance-weighted projected intensity of the displayed color (0-1)
 */
double stimulus_intensity(StimulusColor color);

/**
 * @brief Eye region reported by the face locator (face ROI coordinates)
 *
 * Pupil and glint are optional; when absent they are estimated from the
 * eye patch by the corneal probe.
 */
struct EyeRegion {
    cv::Rect region;
    std::optional<cv::Point2f> pupil;
    std::optional<cv::Point2f> glint;
};

/**
 * @brief Geometry metadata from the face locator
 */
struct FrameBoxMetadata {
    // Source-frame coordinates
    std::optional<cv::Rect> face_box;
    std::optional<cv::Rect> forehead_box;

    // Face ROI coordinates
    std::optional<cv::Rect> shadow_boundary;  // e.g. beside the nose
    std::optional<EyeRegion> left_eye;
    std::optional<EyeRegion> right_eye;
};

/**
 * @brief Frame submitted to a liveness session
 *
 * Transient: the session extracts what its rolling buffers need and
 * does not retain the images.
 */
class FrameBox {
public:
    uint64_t sequence_id = 0;

    // Capture timestamp in milliseconds
    double timestamp_ms = 0.0;

    // BGR, CV_8UC3
    cv::Mat face;
    cv::Mat forehead;

    StimulusColor stimulus = StimulusColor::NONE;

    FrameBoxMetadata metadata;

    FrameBox() = default;
    FrameBox(const cv::Mat& face_roi, const cv::Mat& forehead_roi,
             StimulusColor color, double timestamp);

    bool has_face() const;
    bool has_forehead() const;

    /**
     * @brief Both ROIs are non-empty 8-bit BGR images
     */
    bool has_valid_format() const;

    /**
     * @brief Frame summary as JSON string (no pixel data)
     */
    std::string to_json() const;
};

} // namespace prism
