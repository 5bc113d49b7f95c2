#include "LivenessConfig.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace prism {

namespace {

void require(bool cond, const std::string& option, const std::string& rule) {
    if (!cond) {
        throw std::invalid_argument("invalid config: " + option + " " + rule);
    }
}

// Largest ring buffer / history any option may ask for
constexpr size_t kMaxBufferSamples = 10000;
constexpr size_t kMaxWelchNfft = 65536;

template <typename T>
void read_opt(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if constexpr (std::is_unsigned<T>::value && !std::is_same<T, bool>::value) {
        // get<size_t>() wraps negative numbers
        if (it->is_number() && it->get<double>() < 0.0) {
            throw std::runtime_error(std::string("config value for ") + key + " must not be negative");
        }
    }
    out = it->get<T>();
}

} // namespace

const char* to_string(RppgMethod method) {
    switch (method) {
        case RppgMethod::GREEN: return "GREEN";
        case RppgMethod::CHROM: return "CHROM";
        case RppgMethod::POS:   return "POS";
    }
    return "POS";
}

std::optional<RppgMethod> parse_rppg_method(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "GREEN") return RppgMethod::GREEN;
    if (upper == "CHROM") return RppgMethod::CHROM;
    if (upper == "POS") return RppgMethod::POS;
    return std::nullopt;
}

void LivenessConfig::validate() const {
    require(rppg_window_ms > 0.0, "rppg_window_ms", "must be positive");
    require(rppg_buffer_capacity >= 2 && rppg_buffer_capacity <= kMaxBufferSamples,
            "rppg_buffer_capacity", "must be in [2, 10000]");
    require(rppg_min_samples >= 8, "rppg_min_samples", "must be at least 8");
    require(rppg_min_samples <= rppg_buffer_capacity, "rppg_min_samples",
            "must not exceed rppg_buffer_capacity");
    require(rppg_min_window_ms > 0.0 && rppg_min_window_ms <= rppg_window_ms,
            "rppg_min_window_ms", "must be in (0, rppg_window_ms]");
    require(cardiac_band_low_hz > 0.0 && cardiac_band_low_hz < cardiac_band_high_hz,
            "cardiac_band_low_hz", "must be positive and below cardiac_band_high_hz");
    require(min_bpm > 0.0 && min_bpm < max_bpm, "min_bpm", "must be positive and below max_bpm");
    require(min_signal_quality >= 0.0 && min_signal_quality <= 1.0,
            "min_signal_quality", "must be in [0, 1]");
    require(welch_segment_samples >= 8, "welch_segment_samples", "must be at least 8");
    require(welch_nfft >= welch_segment_samples && welch_nfft <= kMaxWelchNfft, "welch_nfft",
            "must be in [welch_segment_samples, 65536]");
    require(hrv_bin_width_ms > 0.0, "hrv_bin_width_ms", "must be positive");

    require(bpm_history_size >= 1 && bpm_history_size <= kMaxBufferSamples,
            "bpm_history_size", "must be in [1, 10000]");
    require(bpm_stability_history_size <= kMaxBufferSamples,
            "bpm_stability_history_size", "must not exceed 10000");
    require(bpm_stability_min_samples >= 2 &&
            bpm_stability_min_samples <= bpm_stability_history_size,
            "bpm_stability_min_samples", "must be in [2, bpm_stability_history_size]");

    require(max_motion_score >= 0.0, "max_motion_score", "must be non-negative");
    require(min_blur_variance >= 0.0, "min_blur_variance", "must be non-negative");
    require(max_exposure_clip_fraction >= 0.0 && max_exposure_clip_fraction <= 1.0,
            "max_exposure_clip_fraction", "must be in [0, 1]");
    require(exposure_low_level >= 0 && exposure_low_level < exposure_high_level &&
            exposure_high_level <= 255,
            "exposure_low_level", "must satisfy 0 <= low < high <= 255");
    require(min_roi_size >= 1, "min_roi_size", "must be at least 1");

    require(temporal_window_ms > 0.0, "temporal_window_ms", "must be positive");
    require(temporal_buffer_capacity <= kMaxBufferSamples, "temporal_buffer_capacity",
            "must not exceed 10000");
    require(temporal_min_samples >= 12 && temporal_min_samples <= temporal_buffer_capacity,
            "temporal_min_samples", "must be in [12, temporal_buffer_capacity]");
    require(xcorr_max_lag_ms > 0.0, "xcorr_max_lag_ms", "must be positive");
    require(response_delay_min_ms >= 0.0 && response_delay_min_ms < response_delay_max_ms,
            "response_delay_min_ms", "must be non-negative and below response_delay_max_ms");
    require(response_delay_max_ms <= xcorr_max_lag_ms, "response_delay_max_ms",
            "must not exceed xcorr_max_lag_ms");
    require(xcorr_min_strength > 0.0 && xcorr_min_strength <= 1.0,
            "xcorr_min_strength", "must be in (0, 1]");

    require(sss_min_ratio > 0.0 && sss_min_ratio < sss_max_ratio,
            "sss_min_ratio", "must be positive and below sss_max_ratio");
    require(chroma_sensitivity > 0.0, "chroma_sensitivity", "must be positive");
    require(corneal_window_frames <= kMaxBufferSamples, "corneal_window_frames",
            "must not exceed 10000");
    require(corneal_min_frames >= 3 && corneal_min_frames <= corneal_window_frames,
            "corneal_min_frames", "must be in [3, corneal_window_frames]");
    require(corneal_min_decoupling >= 0.0 && corneal_min_decoupling <= 1.0,
            "corneal_min_decoupling", "must be in [0, 1]");
    require(corneal_min_symmetry >= 0.0 && corneal_min_symmetry <= 1.0,
            "corneal_min_symmetry", "must be in [0, 1]");

    require(texture_reference_std > 0.0, "texture_reference_std", "must be positive");
    require(texture_uniformity_threshold > 0.0 && texture_uniformity_threshold < 1.0,
            "texture_uniformity_threshold", "must be in (0, 1)");
    require(flicker_min_hz > cardiac_band_high_hz, "flicker_min_hz",
            "must lie above the cardiac band");
    require(flicker_ratio_threshold > 0.0, "flicker_ratio_threshold", "must be positive");
    require(flicker_window_samples >= 16 && flicker_window_samples <= kMaxBufferSamples,
            "flicker_window_samples", "must be in [16, 10000]");
    require(moire_threshold > 0.0 && moire_threshold < 1.0, "moire_threshold",
            "must be in (0, 1)");
    require(static_window_samples <= kMaxBufferSamples, "static_window_samples",
            "must not exceed 10000");
    require(static_min_samples >= 2 && static_min_samples <= static_window_samples,
            "static_min_samples", "must be in [2, static_window_samples]");
    require(min_signal_variance >= 0.0 && min_signal_variance < max_signal_variance,
            "min_signal_variance", "must be non-negative and below max_signal_variance");
    require(min_face_aspect > 0.0 && min_face_aspect < max_face_aspect,
            "min_face_aspect", "must be positive and below max_face_aspect");

    require(warmup_min_ms >= 0.0, "warmup_min_ms", "must be non-negative");
    require(decision_threshold > 0.0 && decision_threshold <= 100.0,
            "decision_threshold", "must be in (0, 100]");
    require(decision_stable_frames >= 1, "decision_stable_frames", "must be at least 1");

    const FusionWeights& w = weights;
    for (double v : {w.rppg, w.rppg_warmup_bonus, w.hrv, w.physics_sss, w.corneal,
                     w.corneal_symmetry_bonus, w.chroma, w.temporal, w.temporal_strength_bonus,
                     w.moire_bonus, w.moire_penalty, w.alive_bonus, w.static_penalty,
                     w.lighting_penalty, w.flicker_penalty, w.bpm_instability_max_penalty}) {
        require(v >= 0.0, "weights", "must all be non-negative");
    }
}

LivenessConfig LivenessConfig::strict() {
    LivenessConfig config;
    config.decision_threshold = 60.0;
    config.min_signal_quality = 0.45;
    config.xcorr_min_strength = 0.5;
    config.flicker_hard_gate = true;
    config.static_image_hard_gate = true;
    config.warmup_min_frames = 60;
    config.warmup_min_ms = 2000.0;
    return config;
}

LivenessConfig LivenessConfig::from_json(const nlohmann::json& j) {
    LivenessConfig c;
    try {
        auto method_it = j.find("rppg_method");
        if (method_it != j.end() && !method_it->is_null()) {
            auto method = parse_rppg_method(method_it->get<std::string>());
            if (!method) {
                throw std::runtime_error("unknown rppg_method: " + method_it->get<std::string>());
            }
            c.rppg_method = *method;
        }

        read_opt(j, "rppg_window_ms", c.rppg_window_ms);
        read_opt(j, "rppg_buffer_capacity", c.rppg_buffer_capacity);
        read_opt(j, "rppg_min_samples", c.rppg_min_samples);
        read_opt(j, "rppg_min_window_ms", c.rppg_min_window_ms);
        read_opt(j, "cardiac_band_low_hz", c.cardiac_band_low_hz);
        read_opt(j, "cardiac_band_high_hz", c.cardiac_band_high_hz);
        read_opt(j, "min_bpm", c.min_bpm);
        read_opt(j, "max_bpm", c.max_bpm);
        read_opt(j, "min_signal_quality", c.min_signal_quality);
        read_opt(j, "welch_segment_samples", c.welch_segment_samples);
        read_opt(j, "welch_nfft", c.welch_nfft);

        read_opt(j, "hrv_bin_width_ms", c.hrv_bin_width_ms);
        read_opt(j, "hrv_min_rmssd_ms", c.hrv_min_rmssd_ms);
        read_opt(j, "hrv_min_entropy", c.hrv_min_entropy);

        read_opt(j, "bpm_history_size", c.bpm_history_size);
        read_opt(j, "bpm_stability_history_size", c.bpm_stability_history_size);
        read_opt(j, "bpm_stability_min_samples", c.bpm_stability_min_samples);
        read_opt(j, "bpm_stability_max_std", c.bpm_stability_max_std);

        read_opt(j, "enable_quality_gate", c.enable_quality_gate);
        read_opt(j, "max_motion_score", c.max_motion_score);
        read_opt(j, "min_blur_variance", c.min_blur_variance);
        read_opt(j, "max_exposure_clip_fraction", c.max_exposure_clip_fraction);
        read_opt(j, "exposure_low_level", c.exposure_low_level);
        read_opt(j, "exposure_high_level", c.exposure_high_level);
        read_opt(j, "min_roi_size", c.min_roi_size);

        read_opt(j, "enable_temporal_xcorr", c.enable_temporal_xcorr);
        read_opt(j, "temporal_window_ms", c.temporal_window_ms);
        read_opt(j, "temporal_buffer_capacity", c.temporal_buffer_capacity);
        read_opt(j, "temporal_min_samples", c.temporal_min_samples);
        read_opt(j, "xcorr_max_lag_ms", c.xcorr_max_lag_ms);
        read_opt(j, "response_delay_min_ms", c.response_delay_min_ms);
        read_opt(j, "response_delay_max_ms", c.response_delay_max_ms);
        read_opt(j, "xcorr_min_strength", c.xcorr_min_strength);

        read_opt(j, "sss_min_ratio", c.sss_min_ratio);
        read_opt(j, "sss_max_ratio", c.sss_max_ratio);
        read_opt(j, "chroma_sensitivity", c.chroma_sensitivity);
        read_opt(j, "corneal_window_frames", c.corneal_window_frames);
        read_opt(j, "corneal_min_frames", c.corneal_min_frames);
        read_opt(j, "corneal_min_pupil_motion_px", c.corneal_min_pupil_motion_px);
        read_opt(j, "corneal_min_decoupling", c.corneal_min_decoupling);
        read_opt(j, "corneal_min_symmetry", c.corneal_min_symmetry);

        read_opt(j, "texture_reference_std", c.texture_reference_std);
        read_opt(j, "texture_uniformity_threshold", c.texture_uniformity_threshold);
        read_opt(j, "flicker_min_hz", c.flicker_min_hz);
        read_opt(j, "flicker_ratio_threshold", c.flicker_ratio_threshold);
        read_opt(j, "flicker_window_samples", c.flicker_window_samples);
        read_opt(j, "flicker_hard_gate", c.flicker_hard_gate);
        read_opt(j, "moire_threshold", c.moire_threshold);
        read_opt(j, "static_window_samples", c.static_window_samples);
        read_opt(j, "static_min_samples", c.static_min_samples);
        read_opt(j, "min_signal_variance", c.min_signal_variance);
        read_opt(j, "max_signal_variance", c.max_signal_variance);
        read_opt(j, "static_image_hard_gate", c.static_image_hard_gate);
        read_opt(j, "min_face_aspect", c.min_face_aspect);
        read_opt(j, "max_face_aspect", c.max_face_aspect);

        read_opt(j, "warmup_min_frames", c.warmup_min_frames);
        read_opt(j, "warmup_min_ms", c.warmup_min_ms);
        read_opt(j, "decision_threshold", c.decision_threshold);
        read_opt(j, "decision_stable_frames", c.decision_stable_frames);

        auto w = j.find("weights");
        if (w != j.end() && w->is_object()) {
            read_opt(*w, "rppg", c.weights.rppg);
            read_opt(*w, "rppg_warmup_bonus", c.weights.rppg_warmup_bonus);
            read_opt(*w, "hrv", c.weights.hrv);
            read_opt(*w, "physics_sss", c.weights.physics_sss);
            read_opt(*w, "corneal", c.weights.corneal);
            read_opt(*w, "corneal_symmetry_bonus", c.weights.corneal_symmetry_bonus);
            read_opt(*w, "chroma", c.weights.chroma);
            read_opt(*w, "temporal", c.weights.temporal);
            read_opt(*w, "temporal_strength_bonus", c.weights.temporal_strength_bonus);
            read_opt(*w, "moire_bonus", c.weights.moire_bonus);
            read_opt(*w, "moire_penalty", c.weights.moire_penalty);
            read_opt(*w, "alive_bonus", c.weights.alive_bonus);
            read_opt(*w, "static_penalty", c.weights.static_penalty);
            read_opt(*w, "lighting_penalty", c.weights.lighting_penalty);
            read_opt(*w, "flicker_penalty", c.weights.flicker_penalty);
            read_opt(*w, "bpm_instability_max_penalty", c.weights.bpm_instability_max_penalty);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("config type error: ") + e.what());
    }
    return c;
}

LivenessConfig LivenessConfig::load_file(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        throw std::runtime_error("cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        config_file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("cannot parse config file " + path + ": " + e.what());
    }

    LivenessConfig config = from_json(j);
    config.validate();
    return config;
}

nlohmann::json LivenessConfig::to_json() const {
    nlohmann::json j = {
        {"rppg_method", prism::to_string(rppg_method)},
        {"rppg_window_ms", rppg_window_ms},
        {"rppg_buffer_capacity", rppg_buffer_capacity},
        {"rppg_min_samples", rppg_min_samples},
        {"rppg_min_window_ms", rppg_min_window_ms},
        {"cardiac_band_low_hz", cardiac_band_low_hz},
        {"cardiac_band_high_hz", cardiac_band_high_hz},
        {"min_bpm", min_bpm},
        {"max_bpm", max_bpm},
        {"min_signal_quality", min_signal_quality},
        {"welch_segment_samples", welch_segment_samples},
        {"welch_nfft", welch_nfft},
        {"hrv_bin_width_ms", hrv_bin_width_ms},
        {"hrv_min_rmssd_ms", hrv_min_rmssd_ms},
        {"hrv_min_entropy", hrv_min_entropy},
        {"bpm_history_size", bpm_history_size},
        {"bpm_stability_history_size", bpm_stability_history_size},
        {"bpm_stability_min_samples", bpm_stability_min_samples},
        {"bpm_stability_max_std", bpm_stability_max_std},
        {"enable_quality_gate", enable_quality_gate},
        {"max_motion_score", max_motion_score},
        {"min_blur_variance", min_blur_variance},
        {"max_exposure_clip_fraction", max_exposure_clip_fraction},
        {"exposure_low_level", exposure_low_level},
        {"exposure_high_level", exposure_high_level},
        {"min_roi_size", min_roi_size},
        {"enable_temporal_xcorr", enable_temporal_xcorr},
        {"temporal_window_ms", temporal_window_ms},
        {"temporal_buffer_capacity", temporal_buffer_capacity},
        {"temporal_min_samples", temporal_min_samples},
        {"xcorr_max_lag_ms", xcorr_max_lag_ms},
        {"response_delay_min_ms", response_delay_min_ms},
        {"response_delay_max_ms", response_delay_max_ms},
        {"xcorr_min_strength", xcorr_min_strength},
        {"sss_min_ratio", sss_min_ratio},
        {"sss_max_ratio", sss_max_ratio},
        {"chroma_sensitivity", chroma_sensitivity},
        {"corneal_window_frames", corneal_window_frames},
        {"corneal_min_frames", corneal_min_frames},
        {"corneal_min_pupil_motion_px", corneal_min_pupil_motion_px},
        {"corneal_min_decoupling", corneal_min_decoupling},
        {"corneal_min_symmetry", corneal_min_symmetry},
        {"texture_reference_std", texture_reference_std},
        {"texture_uniformity_threshold", texture_uniformity_threshold},
        {"flicker_min_hz", flicker_min_hz},
        {"flicker_ratio_threshold", flicker_ratio_threshold},
        {"flicker_window_samples", flicker_window_samples},
        {"flicker_hard_gate", flicker_hard_gate},
        {"moire_threshold", moire_threshold},
        {"static_window_samples", static_window_samples},
        {"static_min_samples", static_min_samples},
        {"min_signal_variance", min_signal_variance},
        {"max_signal_variance", max_signal_variance},
        {"static_image_hard_gate", static_image_hard_gate},
        {"min_face_aspect", min_face_aspect},
        {"max_face_aspect", max_face_aspect},
        {"warmup_min_frames", warmup_min_frames},
        {"warmup_min_ms", warmup_min_ms},
        {"decision_threshold", decision_threshold},
        {"decision_stable_frames", decision_stable_frames}
    };
    j["weights"] = {
        {"rppg", weights.rppg},
        {"rppg_warmup_bonus", weights.rppg_warmup_bonus},
        {"hrv", weights.hrv},
        {"physics_sss", weights.physics_sss},
        {"corneal", weights.corneal},
        {"corneal_symmetry_bonus", weights.corneal_symmetry_bonus},
        {"chroma", weights.chroma},
        {"temporal", weights.temporal},
        {"temporal_strength_bonus", weights.temporal_strength_bonus},
        {"moire_bonus", weights.moire_bonus},
        {"moire_penalty", weights.moire_penalty},
        {"alive_bonus", weights.alive_bonus},
        {"static_penalty", weights.static_penalty},
        {"lighting_penalty", weights.lighting_penalty},
        {"flicker_penalty", weights.flicker_penalty},
        {"bpm_instability_max_penalty", weights.bpm_instability_max_penalty}
    };
    return j;
}

} // namespace prism
