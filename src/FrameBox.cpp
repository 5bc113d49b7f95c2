#include "FrameBox.hpp"
#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace prism {

namespace {

bool is_bgr8(const cv::Mat& m) {
    return !m.empty() && m.type() == CV_8UC3;
}

nlohmann::json rect_json(const cv::Rect& r) {
    return {{"x", r.x}, {"y", r.y}, {"w", r.width}, {"h", r.height}};
}

} // namespace

const char* to_string(StimulusColor color) {
    switch (color) {
        case StimulusColor::NONE:  return "NONE";
        case StimulusColor::RED:   return "RED";
        case StimulusColor::GREEN: return "GREEN";
        case StimulusColor::BLUE:  return "BLUE";
        case StimulusColor::WHITE: return "WHITE";
    }
    return "NONE";
}

std::optional<StimulusColor> parse_stimulus(const std::string& label) {
    std::string upper = label;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NONE") return StimulusColor::NONE;
    if (upper == "RED") return StimulusColor::RED;
    if (upper == "GREEN") return StimulusColor::GREEN;
    if (upper == "BLUE") return StimulusColor::BLUE;
    if (upper == "WHITE") return StimulusColor::WHITE;
    return std::nullopt;
}

cv::Vec3d stimulus_rgb(StimulusColor color) {
    switch (color) {
        case StimulusColor::RED:   return {1.0, 0.0, 0.0};
        case StimulusColor::GREEN: return {0.0, 1.0, 0.0};
        case StimulusColor::BLUE:  return {0.0, 0.0, 1.0};
        case StimulusColor::WHITE: return {1.0, 1.0, 1.0};
        case StimulusColor::NONE:  break;
    }
    return {0.0, 0.0, 0.0};
}

double stimulus_intensity(StimulusColor color) {
    // Same weights as cv::COLOR_BGR2GRAY so stimulus and response share a scale
    cv::Vec3d rgb = stimulus_rgb(color);
    return 0.299 * rgb[0] + 0.587 * rgb[1] + 0.114 * rgb[2];
}

FrameBox::FrameBox(const cv::Mat& face_roi, const cv::Mat& forehead_roi,
                   StimulusColor color, double timestamp)
    : timestamp_ms(timestamp),
      face(face_roi),
      forehead(forehead_roi),
      stimulus(color)
{
}

bool FrameBox::has_face() const {
    return !face.empty() && face.cols > 0 && face.rows > 0;
}

bool FrameBox::has_forehead() const {
    return !forehead.empty() && forehead.cols > 0 && forehead.rows > 0;
}

bool FrameBox::has_valid_format() const {
    return is_bgr8(face) && is_bgr8(forehead);
}

std::string FrameBox::to_json() const {
    nlohmann::json j = {
        {"sequence_id", sequence_id},
        {"timestamp_ms", timestamp_ms},
        {"stimulus", prism::to_string(stimulus)},
        {"face_width", face.cols},
        {"face_height", face.rows},
        {"forehead_width", forehead.cols},
        {"forehead_height", forehead.rows}
    };
    if (metadata.face_box) j["face_box"] = rect_json(*metadata.face_box);
    if (metadata.forehead_box) j["forehead_box"] = rect_json(*metadata.forehead_box);
    if (metadata.shadow_boundary) j["shadow_boundary"] = rect_json(*metadata.shadow_boundary);
    j["has_left_eye"] = metadata.left_eye.has_value();
    j["has_right_eye"] = metadata.right_eye.has_value();
    return j.dump();
}

} // namespace prism
