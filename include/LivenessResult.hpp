#pragma once

#include "LivenessConfig.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace prism {

/**
 * @brief Per-session decision state
 */
enum class DecisionState {
    WARMUP,   // Evidence accumulating, no decision emitted
    ACTIVE,   // Deciding on every update
    DECIDED   // Decision stable for decision_stable_frames updates
};

const char* to_string(DecisionState state);

/**
 * @brief Every sub-signal's raw value and pass/fail status
 *
 * The first block is the stable diagnostic set; everything after it is
 * additive. Absent values serialize as null.
 */
struct LivenessDetails {
    RppgMethod rppg_method = RppgMethod::POS;
    bool quality_gate = false;
    std::string quality_gate_reason = "none";
    bool chroma_passed = false;
    bool physics_passed = false;
    std::optional<double> sss_ratio;
    bool temporal_xcorr_passed = false;
    std::optional<double> temporal_xcorr_strength;
    std::optional<double> temporal_xcorr_delay_ms;
    bool is_static_image = false;
    double signal_variance = 0.0;
    bool lighting_unstable = false;
    bool screen_texture_detected = false;
    double texture_uniformity = 0.0;
    bool screen_flicker_detected = false;
    double screen_flicker_ratio = 0.0;
    std::string forced_false_reason;

    // Additive diagnostics
    std::string provisional_forced_reason;   // Hard gate that would fire once warmup ends
    DecisionState decision_state = DecisionState::WARMUP;
    size_t accepted_frames = 0;
    size_t rppg_samples = 0;
    size_t temporal_samples = 0;
    std::optional<double> bpm_raw;
    std::optional<double> bpm_stability_std;
    std::optional<double> hrv_rmssd_ms;
    std::optional<double> hrv_sdnn_ms;
    std::optional<double> hrv_entropy;
    bool hrv_valid = false;
    bool sss_passed = false;
    bool corneal_passed = false;
    std::optional<double> corneal_decoupling;
    std::optional<double> corneal_symmetry;
    std::optional<double> temporal_step_delay_ms;
    bool moire_detected = false;
    double moire_score = 0.0;
    double motion_score = 0.0;
    double blur_variance = 0.0;
    double exposure_clip_fraction = 0.0;

    // Fusion contributions (points) and provisional values
    std::map<std::string, double> scores;
};

/**
 * @brief Output of one fusion update
 */
struct LivenessResult {
    bool is_human = false;
    double confidence = 0.0;        // 0-100
    std::optional<double> bpm;
    double signal_quality = 0.0;    // 0-1
    double hrv_score = 0.0;         // 0-1
    LivenessDetails details;

    nlohmann::json to_json() const;
};

} // namespace prism
