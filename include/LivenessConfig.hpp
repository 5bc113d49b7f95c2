#pragma once

#include <cstddef>
#include <string>
#include <optional>

#include <nlohmann/json.hpp>

namespace prism {

/**
 * @brief rPPG extraction method, selected once per session
 */
enum class RppgMethod {
    GREEN,  // Raw green channel, detrended
    CHROM,  // de Haan & Jeanne chrominance projection
    POS     // Plane-orthogonal-to-skin projection (default)
};

const char* to_string(RppgMethod method);
std::optional<RppgMethod> parse_rppg_method(const std::string& name);

/**
 * @brief Fusion weights and penalties (confidence points, 0-100 scale)
 */
struct FusionWeights {
    double rppg = 25.0;                  // Scaled by signal quality
    double rppg_warmup_bonus = 5.0;      // While the RGB buffer is still filling
    double hrv = 10.0;
    double physics_sss = 10.0;
    double corneal = 10.0;
    double corneal_symmetry_bonus = 5.0;
    double chroma = 25.0;
    double temporal = 20.0;
    double temporal_strength_bonus = 10.0;  // Max bonus, scaled by xcorr strength
    double moire_bonus = 5.0;
    double moire_penalty = 15.0;
    double alive_bonus = 15.0;
    double static_penalty = 50.0;
    double lighting_penalty = 10.0;
    double flicker_penalty = 40.0;
    double bpm_instability_max_penalty = 30.0;
};

/**
 * @brief Configuration for the liveness engine
 *
 * Shared read-only between sessions. Call validate() before use;
 * session and manager constructors do it for you.
 */
struct LivenessConfig {
    // rPPG
    RppgMethod rppg_method = RppgMethod::POS;
    double rppg_window_ms = 5000.0;        // Rolling RGB buffer duration
    size_t rppg_buffer_capacity = 300;     // Hard cap on buffered samples
    size_t rppg_min_samples = 90;
    double rppg_min_window_ms = 3000.0;
    double cardiac_band_low_hz = 0.67;     // 40 BPM
    double cardiac_band_high_hz = 3.0;     // 180 BPM
    double min_bpm = 40.0;
    double max_bpm = 180.0;
    double min_signal_quality = 0.3;
    size_t welch_segment_samples = 128;
    size_t welch_nfft = 1024;

    // HRV
    double hrv_bin_width_ms = 7.8125;      // Standard HRV histogram bin
    double hrv_min_rmssd_ms = 3.0;
    double hrv_min_entropy = 0.1;

    // BPM smoothing / stability
    size_t bpm_history_size = 10;
    size_t bpm_stability_history_size = 30;
    size_t bpm_stability_min_samples = 15;
    double bpm_stability_max_std = 20.0;

    // Quality gate
    bool enable_quality_gate = true;
    double max_motion_score = 20.0;
    double min_blur_variance = 15.0;
    double max_exposure_clip_fraction = 0.35;
    int exposure_low_level = 5;
    int exposure_high_level = 250;
    int min_roi_size = 20;

    // Temporal response
    bool enable_temporal_xcorr = true;
    double temporal_window_ms = 4000.0;
    size_t temporal_buffer_capacity = 240;
    size_t temporal_min_samples = 45;
    double xcorr_max_lag_ms = 500.0;
    double response_delay_min_ms = 100.0;
    double response_delay_max_ms = 300.0;
    double xcorr_min_strength = 0.3;

    // Physics probes
    double sss_min_ratio = 1.05;
    double sss_max_ratio = 4.0;
    double chroma_sensitivity = 0.9;
    size_t corneal_window_frames = 15;
    size_t corneal_min_frames = 6;
    double corneal_min_pupil_motion_px = 0.5;
    double corneal_min_decoupling = 0.35;
    double corneal_min_symmetry = 0.6;

    // Spoof detection
    double texture_reference_std = 7.5;
    double texture_uniformity_threshold = 0.5;
    double flicker_min_hz = 5.0;
    double flicker_ratio_threshold = 1.5;
    size_t flicker_window_samples = 60;
    bool flicker_hard_gate = false;
    double moire_threshold = 0.08;
    size_t static_window_samples = 90;
    size_t static_min_samples = 60;
    double min_signal_variance = 0.4;      // Coefficient of variation, percent
    double max_signal_variance = 25.0;
    bool static_image_hard_gate = true;
    double min_face_aspect = 0.4;
    double max_face_aspect = 2.5;

    // Fusion / decision
    size_t warmup_min_frames = 30;
    double warmup_min_ms = 1000.0;
    double decision_threshold = 40.0;
    size_t decision_stable_frames = 15;
    FusionWeights weights;

    /**
     * @brief Check option ranges and combinations
     * @throws std::invalid_argument naming the offending option
     */
    void validate() const;

    /**
     * @brief Production-strict preset
     *
     * Higher decision threshold, flicker promoted to a hard gate and a
     * stronger temporal correlation requirement.
     */
    static LivenessConfig strict();

    /**
     * @brief Build from JSON; missing keys keep their defaults
     * @throws std::runtime_error on type errors or unknown enum names
     */
    static LivenessConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load and validate a JSON config file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static LivenessConfig load_file(const std::string& path);

    nlohmann::json to_json() const;
};

} // namespace prism
