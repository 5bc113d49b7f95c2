#include "SyntheticSource.hpp"

#include <algorithm>
#include <cmath>

namespace prism {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct Hold {
    StimulusColor color;
    double duration_ms;
};

// Uneven holds so the stimulus autocorrelation has a single peak
const Hold kSchedule[] = {
    {StimulusColor::RED,   700.0},
    {StimulusColor::BLUE,  500.0},
    {StimulusColor::GREEN, 900.0},
    {StimulusColor::WHITE, 600.0},
};
constexpr double kScheduleMs = 2700.0;

cv::Mat make_texture(cv::Size size, double stddev, cv::RNG& rng) {
    cv::Mat tex(size, CV_32F, cv::Scalar(0));
    if (stddev > 0.0) {
        rng.fill(tex, cv::RNG::NORMAL, 0.0, stddev);
    }
    return tex;
}

// base + texture (same in all channels) + per-channel offset
cv::Mat compose(const cv::Mat& texture, const cv::Scalar& base, const cv::Vec3d& offset_bgr) {
    std::vector<cv::Mat> channels(3);
    for (int c = 0; c < 3; ++c) {
        texture.convertTo(channels[c], CV_8U, 1.0, base[c] + offset_bgr[c]);
    }
    cv::Mat out;
    cv::merge(channels, out);
    return out;
}

} // namespace

SyntheticSource::SyntheticSource(const SyntheticParams& params) : params_(params) {
    cv::RNG rng(params_.seed);
    face_texture_ = make_texture(params_.face_size, params_.texture_std, rng);
    forehead_texture_ = make_texture(params_.forehead_size, params_.texture_std, rng);
}

double SyntheticSource::timestamp_ms(size_t index) const {
    return static_cast<double>(index) * 1000.0 / params_.fps;
}

StimulusColor SyntheticSource::stimulus_at(double timestamp_ms) const {
    if (!params_.cycle_stimulus) return StimulusColor::NONE;

    double t = std::fmod(std::max(0.0, timestamp_ms), kScheduleMs);
    for (const auto& hold : kSchedule) {
        if (t < hold.duration_ms) return hold.color;
        t -= hold.duration_ms;
    }
    return kSchedule[0].color;
}

FrameBox SyntheticSource::frame(size_t index) const {
    const double t = timestamp_ms(index);

    const double pulse = params_.pulse_amplitude *
                         std::sin(2.0 * kPi * (params_.pulse_bpm / 60.0) * t / 1000.0);
    cv::Mat forehead = compose(forehead_texture_, params_.forehead_bgr, cv::Vec3d(0.0, pulse, 0.0));

    // Face reflects what was displayed response_delay_ms ago
    const cv::Vec3d rgb = stimulus_rgb(stimulus_at(t - params_.response_delay_ms));
    const double g = params_.stimulus_gain;
    cv::Mat face = compose(face_texture_, params_.face_bgr, cv::Vec3d(g * rgb[2], g * rgb[1], g * rgb[0]));

    FrameBox box(face, forehead, stimulus_at(t), t);
    box.sequence_id = index;
    return box;
}

} // namespace prism
