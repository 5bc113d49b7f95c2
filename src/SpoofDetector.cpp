#include "SpoofDetector.hpp"
#include "SignalProcessing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

// Debug logging flag - set to false for production to avoid hot-path logging
#define ENABLE_DEBUG_LOGGING false

namespace prism {

namespace {

constexpr int kTextureKernel = 5;
constexpr int kMoireDcHalfWidth = 10;
constexpr double kFlickerCardiacLowHz = 0.75;

// Swap quadrants so the DC term sits in the center
void shift_spectrum(cv::Mat& mag) {
    const int cx = mag.cols / 2;
    const int cy = mag.rows / 2;
    cv::Mat q0(mag, cv::Rect(0, 0, cx, cy));
    cv::Mat q1(mag, cv::Rect(cx, 0, cx, cy));
    cv::Mat q2(mag, cv::Rect(0, cy, cx, cy));
    cv::Mat q3(mag, cv::Rect(cx, cy, cx, cy));
    cv::Mat tmp;
    q0.copyTo(tmp);
    q3.copyTo(q0);
    tmp.copyTo(q3);
    q1.copyTo(tmp);
    q2.copyTo(q1);
    tmp.copyTo(q2);
}

bool contains(const cv::Rect& outer, const cv::Rect& inner) {
    return inner.width > 0 && inner.height > 0 && (inner & outer) == inner;
}

} // namespace

SpoofDetector::SpoofDetector(const LivenessConfig& config) : config_(config) {
}

TextureResult SpoofDetector::check_texture(const cv::Mat& face_gray) const {
    TextureResult result;
    if (face_gray.empty()) return result;

    cv::Mat f;
    face_gray.convertTo(f, CV_64F);

    // Local std via E[x^2] - E[x]^2 over a small window
    cv::Mat mu, mu2;
    const cv::Size k(kTextureKernel, kTextureKernel);
    cv::blur(f, mu, k);
    cv::blur(f.mul(f), mu2, k);
    cv::Mat var = mu2 - mu.mul(mu);
    var = cv::max(var, 0.0);
    cv::Mat sd;
    cv::sqrt(var, sd);

    result.local_std = cv::mean(sd)[0];
    result.uniformity = config_.texture_reference_std /
                        (config_.texture_reference_std + result.local_std);
    result.detected = result.uniformity > config_.texture_uniformity_threshold;

    if (ENABLE_DEBUG_LOGGING) {
        std::cout << "[Texture] local_std=" << result.local_std
                  << " uniformity=" << result.uniformity << std::endl;
    }
    return result;
}

FlickerResult SpoofDetector::check_flicker(const std::vector<GreenSample>& series) const {
    FlickerResult result;
    if (series.size() < config_.flicker_window_samples) return result;

    std::vector<double> t, v;
    for (size_t i = series.size() - config_.flicker_window_samples; i < series.size(); ++i) {
        t.push_back(series[i].timestamp_ms);
        v.push_back(series[i].value);
    }

    const double fs = dsp::estimate_sample_rate(t);
    if (fs / 2.0 <= config_.flicker_min_hz) {
        // Frame rate too low to see anything above the flicker cutoff
        return result;
    }

    std::vector<double> sig = dsp::resample_uniform(t, v, fs);
    const double m = dsp::mean(sig);
    for (double& x : sig) x -= m;

    dsp::Spectrum amp = dsp::amplitude_spectrum(sig, fs);
    const double cardiac = dsp::band_sum(amp, kFlickerCardiacLowHz, config_.cardiac_band_high_hz);
    const double high = dsp::sum_above(amp, config_.flicker_min_hz);

    result.evaluated = true;
    result.ratio = high / (cardiac + 1e-6);
    result.detected = result.ratio > config_.flicker_ratio_threshold;
    return result;
}

MoireResult SpoofDetector::check_moire(const cv::Mat& face_gray) const {
    MoireResult result;
    if (face_gray.empty()) return result;

    // Even dimensions so the quadrant swap is exact
    cv::Mat gray = face_gray(cv::Rect(0, 0, face_gray.cols & -2, face_gray.rows & -2));
    if (gray.empty()) return result;

    cv::Mat f;
    gray.convertTo(f, CV_32F);
    cv::Mat planes[] = {f, cv::Mat::zeros(f.size(), CV_32F)};
    cv::Mat complex;
    cv::merge(planes, 2, complex);
    cv::dft(complex, complex);
    cv::split(complex, planes);

    cv::Mat mag;
    cv::magnitude(planes[0], planes[1], mag);
    mag += cv::Scalar::all(1);
    cv::log(mag, mag);
    shift_spectrum(mag);

    double max_val = 0.0;
    cv::minMaxLoc(mag, nullptr, &max_val);
    if (max_val <= 1e-10) return result;
    mag /= max_val;

    // Drop DC and the lowest frequencies
    const cv::Rect bounds(0, 0, mag.cols, mag.rows);
    const cv::Rect dc(mag.cols / 2 - kMoireDcHalfWidth, mag.rows / 2 - kMoireDcHalfWidth,
                      2 * kMoireDcHalfWidth, 2 * kMoireDcHalfWidth);
    mag(dc & bounds).setTo(0);

    result.evaluated = true;
    cv::Mat positive = mag > 0;
    const int count = cv::countNonZero(positive);
    if (count == 0) return result;

    double peak = 0.0;
    cv::minMaxLoc(mag, nullptr, &peak);
    const double mean_val = cv::mean(mag, positive)[0];

    result.score = peak / (mean_val + 1e-10);
    result.detected = result.score > (1.0 / config_.moire_threshold);
    return result;
}

VarianceResult SpoofDetector::check_variance(const std::vector<GreenSample>& series) const {
    VarianceResult result;
    if (series.size() < config_.static_min_samples) return result;

    const size_t n = std::min(series.size(), config_.static_window_samples);
    std::vector<double> recent;
    recent.reserve(n);
    for (size_t i = series.size() - n; i < series.size(); ++i) recent.push_back(series[i].value);

    const double m = std::max(1.0, dsp::mean(recent));
    result.evaluated = true;
    result.signal_variance = dsp::stddev(recent) / m * 100.0;
    result.is_static = result.signal_variance < config_.min_signal_variance;
    result.lighting_unstable = result.signal_variance > config_.max_signal_variance;
    return result;
}

GeometryResult SpoofDetector::check_geometry(const FrameBox& frame) const {
    GeometryResult result;
    const auto& md = frame.metadata;

    auto fail = [&result](const std::string& detail) {
        result.valid = false;
        result.detail = detail;
        return result;
    };

    cv::Size face_size(frame.face.cols, frame.face.rows);
    if (md.face_box) {
        if (md.face_box->width <= 0 || md.face_box->height <= 0) return fail("empty_face_box");
        face_size = md.face_box->size();
        if (md.forehead_box && !contains(*md.face_box, *md.forehead_box)) {
            return fail("forehead_outside_face");
        }
    }

    if (face_size.height > 0) {
        const double aspect = static_cast<double>(face_size.width) / face_size.height;
        if (aspect < config_.min_face_aspect || aspect > config_.max_face_aspect) {
            return fail("face_aspect_ratio");
        }
    }

    const cv::Rect face_bounds(0, 0, frame.face.cols, frame.face.rows);
    if (md.left_eye && !contains(face_bounds, md.left_eye->region)) {
        return fail("left_eye_outside_face");
    }
    if (md.right_eye && !contains(face_bounds, md.right_eye->region)) {
        return fail("right_eye_outside_face");
    }
    if (md.shadow_boundary && !contains(face_bounds, *md.shadow_boundary)) {
        return fail("shadow_boundary_outside_face");
    }
    return result;
}

} // namespace prism
