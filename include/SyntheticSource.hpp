#pragma once

#include "FrameBox.hpp"

#include <cstddef>
#include <cstdint>

#include <opencv2/core.hpp>

namespace prism {

/**
 * @brief Parameters of a synthetic subject
 */
struct SyntheticParams {
    double fps = 30.0;

    // Forehead: green-channel pulse on a textured skin patch
    double pulse_bpm = 75.0;
    double pulse_amplitude = 2.0;           // Gray levels, green channel only
    cv::Scalar forehead_bgr{110, 140, 170};
    cv::Size forehead_size{48, 32};

    // Face: stimulus reflection on a textured patch
    cv::Scalar face_bgr{125, 130, 140};
    cv::Size face_size{96, 112};
    double stimulus_gain = 40.0;            // Gray levels per unit stimulus color
    double response_delay_ms = 180.0;
    bool cycle_stimulus = true;

    // Per-pixel texture (fixed over time); 0 gives a flat field
    double texture_std = 20.0;
    uint64_t seed = 42;
};

/**
 * @brief Deterministic synthetic frame source
 *
 * frame(i) depends only on i and the parameters, so replaying the same
 * index gives the same frame. Used by the sanity example and the tests.
 */
class SyntheticSource {
public:
    explicit SyntheticSource(const SyntheticParams& params);

    double timestamp_ms(size_t index) const;

    /**
     * @brief Displayed color at a given time (uneven holds, 2.7 s cycle)
     */
    StimulusColor stimulus_at(double timestamp_ms) const;

    FrameBox frame(size_t index) const;

    const SyntheticParams& params() const { return params_; }

private:
    SyntheticParams params_;
    cv::Mat face_texture_;       // CV_32F, zero mean
    cv::Mat forehead_texture_;
};

} // namespace prism
