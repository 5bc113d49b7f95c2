#include "PhysicsProbes.hpp"
#include "SignalProcessing.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

// Debug logging flag - set to false for production to avoid hot-path logging
#define ENABLE_DEBUG_LOGGING false

namespace prism {

namespace {

constexpr int kMinRegionSize = 3;
constexpr int kMinEyePatchSize = 4;
constexpr double kFlatSharpness = 1e-6;

// Per-eye trajectory reduced to displacements around the window mean
struct EyeTrack {
    std::vector<double> pupil;   // x0, y0, x1, y1, ...
    std::vector<double> glint;
    double mean_glint_displacement = 0.0;
};

EyeTrack build_track(const std::vector<EyeObservation>& obs) {
    EyeTrack track;
    cv::Point2d pupil_mean(0, 0), glint_mean(0, 0);
    for (const auto& o : obs) {
        pupil_mean += cv::Point2d(o.pupil);
        glint_mean += cv::Point2d(o.glint);
    }
    pupil_mean *= 1.0 / static_cast<double>(obs.size());
    glint_mean *= 1.0 / static_cast<double>(obs.size());

    double glint_disp = 0.0;
    for (const auto& o : obs) {
        const cv::Point2d dp = cv::Point2d(o.pupil) - pupil_mean;
        const cv::Point2d dg = cv::Point2d(o.glint) - glint_mean;
        track.pupil.push_back(dp.x);
        track.pupil.push_back(dp.y);
        track.glint.push_back(dg.x);
        track.glint.push_back(dg.y);
        glint_disp += std::sqrt(dg.x * dg.x + dg.y * dg.y);
    }
    track.mean_glint_displacement = glint_disp / static_cast<double>(obs.size());
    return track;
}

} // namespace

PhysicsProbes::PhysicsProbes(const LivenessConfig& config) : config_(config) {
}

cv::Rect PhysicsProbes::shadow_region(const FrameBox& frame) {
    const cv::Rect bounds(0, 0, frame.face.cols, frame.face.rows);
    if (frame.metadata.shadow_boundary) {
        return *frame.metadata.shadow_boundary & bounds;
    }
    // Central nose/cheek band
    const int x = static_cast<int>(frame.face.cols * 0.30);
    const int y = static_cast<int>(frame.face.rows * 0.35);
    const int w = static_cast<int>(frame.face.cols * 0.40);
    const int h = static_cast<int>(frame.face.rows * 0.45);
    return cv::Rect(x, y, w, h) & bounds;
}

SubsurfaceResult PhysicsProbes::probe_subsurface(const FrameBox& frame) const {
    SubsurfaceResult result;
    if (frame.stimulus != StimulusColor::WHITE && frame.stimulus != StimulusColor::RED &&
        frame.stimulus != StimulusColor::BLUE) {
        return result;
    }
    if (frame.face.empty()) return result;

    const cv::Rect region = shadow_region(frame);
    if (region.width < kMinRegionSize || region.height < kMinRegionSize) return result;

    cv::Mat patch;
    cv::GaussianBlur(frame.face(region), patch, cv::Size(3, 3), 0);

    std::vector<cv::Mat> channels;
    cv::split(patch, channels);  // B, G, R

    result.evaluated = true;
    result.blue_sharpness = dsp::laplacian_variance(channels[0]);
    result.red_sharpness = dsp::laplacian_variance(channels[2]);

    if (result.red_sharpness <= kFlatSharpness) {
        // Flat region: no edge to compare
        return result;
    }

    const double ratio = result.blue_sharpness / result.red_sharpness;
    result.ratio = ratio;
    result.passed = ratio >= config_.sss_min_ratio && ratio <= config_.sss_max_ratio;

    if (ENABLE_DEBUG_LOGGING) {
        std::cout << "[SSS] red=" << result.red_sharpness << " blue=" << result.blue_sharpness
                  << " ratio=" << ratio << std::endl;
    }
    return result;
}

std::optional<EyeObservation> PhysicsProbes::locate_eye(const cv::Mat& face_bgr,
                                                        const EyeRegion& eye) const {
    if (eye.pupil && eye.glint) {
        return EyeObservation{*eye.pupil, *eye.glint};
    }

    const cv::Rect region = eye.region & cv::Rect(0, 0, face_bgr.cols, face_bgr.rows);
    if (region.width < kMinEyePatchSize || region.height < kMinEyePatchSize) {
        return std::nullopt;
    }

    cv::Mat gray;
    cv::cvtColor(face_bgr(region), gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(3, 3), 0);

    double min_val = 0.0, max_val = 0.0;
    cv::Point min_loc, max_loc;
    cv::minMaxLoc(gray, &min_val, &max_val, &min_loc, &max_loc);

    const cv::Point2f origin(static_cast<float>(region.x), static_cast<float>(region.y));
    EyeObservation obs;
    obs.pupil = eye.pupil ? *eye.pupil : cv::Point2f(min_loc) + origin;
    obs.glint = eye.glint ? *eye.glint : cv::Point2f(max_loc) + origin;
    return obs;
}

CornealResult PhysicsProbes::probe_corneal(const std::vector<CornealSample>& window) const {
    CornealResult result;

    std::vector<EyeObservation> left, right;
    const size_t start = window.size() > config_.corneal_window_frames
                             ? window.size() - config_.corneal_window_frames
                             : 0;
    for (size_t i = start; i < window.size(); ++i) {
        if (window[i].left) left.push_back(*window[i].left);
        if (window[i].right) right.push_back(*window[i].right);
    }

    std::vector<EyeTrack> tracks;
    if (left.size() >= config_.corneal_min_frames) tracks.push_back(build_track(left));
    if (right.size() >= config_.corneal_min_frames) tracks.push_back(build_track(right));
    if (tracks.empty()) return result;

    std::vector<double> pupil, glint;
    for (const auto& t : tracks) {
        pupil.insert(pupil.end(), t.pupil.begin(), t.pupil.end());
        glint.insert(glint.end(), t.glint.begin(), t.glint.end());
    }

    result.pupil_motion_px = dsp::stddev(pupil);
    if (result.pupil_motion_px < config_.corneal_min_pupil_motion_px) {
        // Eyes did not move enough to say anything
        return result;
    }

    result.evaluated = true;
    const double corr = dsp::pearson(pupil.data(), glint.data(), pupil.size());
    result.decoupling = 1.0 - std::abs(corr);
    result.passed = *result.decoupling >= config_.corneal_min_decoupling;

    if (tracks.size() == 2) {
        const double a = tracks[0].mean_glint_displacement;
        const double b = tracks[1].mean_glint_displacement;
        result.symmetry = (a + b) > 1e-9 ? 1.0 - std::abs(a - b) / (a + b) : 1.0;
        result.symmetry_passed = *result.symmetry >= config_.corneal_min_symmetry;
    }
    return result;
}

ChromaResult PhysicsProbes::check_chroma(const cv::Mat& face_bgr, StimulusColor stimulus) const {
    ChromaResult result;
    if (face_bgr.empty()) return result;

    const cv::Scalar avg = cv::mean(face_bgr);
    const double blue = avg[0];
    const double green = avg[1];
    const double red = avg[2];
    result.face_mean_rgb = cv::Vec3d(red, green, blue);

    switch (stimulus) {
        case StimulusColor::RED:
            result.passed = red > blue * config_.chroma_sensitivity;
            break;
        case StimulusColor::BLUE:
            // Skin absorbs blue, so a looser bound
            result.passed = blue > red * 0.8;
            break;
        case StimulusColor::GREEN:
            result.passed = green > red * 0.9 && green > blue * 0.9;
            break;
        case StimulusColor::WHITE:
            result.passed = true;
            break;
        case StimulusColor::NONE:
            result.passed = false;
            break;
    }
    return result;
}

} // namespace prism
