#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace prism {
namespace utils {

/**
 * @brief Get current timestamp string (for filenames)
 * @param format Format string (default: "%Y%m%d_%H%M%S")
 * @return Timestamp string
 */
std::string get_timestamp_string(const std::string& format = "%Y%m%d_%H%M%S");

/**
 * @brief Create directory if it doesn't exist
 * @param path Directory path
 * @return true if directory exists or was created
 */
bool ensure_directory_exists(const std::string& path);

/** Parent directory of a file path ("" if none) */
std::string parent_directory(const std::string& path);

/** Intersect a rectangle with image bounds */
cv::Rect clamp_rect(const cv::Rect& rect, const cv::Size& bounds);

/**
 * @brief Forehead stand-in when no locator is available
 *
 * Upper-central band of the face: x 30-70%, y 10-30%.
 */
cv::Rect default_forehead_rect(const cv::Size& face_size);

} // namespace utils
} // namespace prism
