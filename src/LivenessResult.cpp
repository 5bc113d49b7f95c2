#include "LivenessResult.hpp"

namespace prism {

namespace {

nlohmann::json nullable(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // namespace

const char* to_string(DecisionState state) {
    switch (state) {
        case DecisionState::WARMUP:  return "WARMUP";
        case DecisionState::ACTIVE:  return "ACTIVE";
        case DecisionState::DECIDED: return "DECIDED";
    }
    return "WARMUP";
}

nlohmann::json LivenessResult::to_json() const {
    const LivenessDetails& d = details;

    nlohmann::json scores = nlohmann::json::object();
    for (const auto& kv : d.scores) scores[kv.first] = kv.second;

    nlohmann::json det = {
        {"rppg_method", prism::to_string(d.rppg_method)},
        {"quality_gate", d.quality_gate},
        {"quality_gate_reason", d.quality_gate_reason},
        {"chroma_passed", d.chroma_passed},
        {"physics_passed", d.physics_passed},
        {"sss_ratio", nullable(d.sss_ratio)},
        {"temporal_xcorr_passed", d.temporal_xcorr_passed},
        {"temporal_xcorr_strength", nullable(d.temporal_xcorr_strength)},
        {"temporal_xcorr_delay_ms", nullable(d.temporal_xcorr_delay_ms)},
        {"is_static_image", d.is_static_image},
        {"signal_variance", d.signal_variance},
        {"lighting_unstable", d.lighting_unstable},
        {"screen_texture_detected", d.screen_texture_detected},
        {"texture_uniformity", d.texture_uniformity},
        {"screen_flicker_detected", d.screen_flicker_detected},
        {"screen_flicker_ratio", d.screen_flicker_ratio},
        {"forced_false_reason", d.forced_false_reason},
        {"provisional_forced_reason", d.provisional_forced_reason},

        {"decision_state", prism::to_string(d.decision_state)},
        {"accepted_frames", d.accepted_frames},
        {"rppg_samples", d.rppg_samples},
        {"temporal_samples", d.temporal_samples},
        {"bpm_raw", nullable(d.bpm_raw)},
        {"bpm_stability_std", nullable(d.bpm_stability_std)},
        {"hrv_rmssd_ms", nullable(d.hrv_rmssd_ms)},
        {"hrv_sdnn_ms", nullable(d.hrv_sdnn_ms)},
        {"hrv_entropy", nullable(d.hrv_entropy)},
        {"hrv_valid", d.hrv_valid},
        {"sss_passed", d.sss_passed},
        {"corneal_passed", d.corneal_passed},
        {"corneal_decoupling", nullable(d.corneal_decoupling)},
        {"corneal_symmetry", nullable(d.corneal_symmetry)},
        {"temporal_step_delay_ms", nullable(d.temporal_step_delay_ms)},
        {"moire_detected", d.moire_detected},
        {"moire_score", d.moire_score},
        {"motion_score", d.motion_score},
        {"blur_variance", d.blur_variance},
        {"exposure_clip_fraction", d.exposure_clip_fraction},
        {"scores", scores}
    };

    return {
        {"is_human", is_human},
        {"confidence", confidence},
        {"bpm", nullable(bpm)},
        {"signal_quality", signal_quality},
        {"hrv_score", hrv_score},
        {"details", det}
    };
}

} // namespace prism
