#include "LivenessSession.hpp"
#include "CryptoUtils.hpp"
#include "SignalProcessing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

// Debug logging flag - set to false for production to avoid hot-path logging
#define ENABLE_DEBUG_LOGGING false

namespace prism {

namespace {

std::shared_ptr<const LivenessConfig> checked(std::shared_ptr<const LivenessConfig> config) {
    if (!config) {
        throw std::invalid_argument("LivenessSession requires a config");
    }
    config->validate();
    return config;
}

std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace

const char* to_string(FrameStatus status) {
    switch (status) {
        case FrameStatus::ACCEPTED:                return "accepted";
        case FrameStatus::MISSING_ROI:             return "missing_roi";
        case FrameStatus::INVALID_FORMAT:          return "invalid_format";
        case FrameStatus::INVALID_TIMESTAMP:       return "invalid_timestamp";
        case FrameStatus::NON_MONOTONIC_TIMESTAMP: return "non_monotonic_timestamp";
        case FrameStatus::UNSUPPORTED_STIMULUS:    return "unsupported_stimulus";
    }
    return "accepted";
}

LivenessSession::LivenessSession(std::shared_ptr<const LivenessConfig> config, std::string id)
    : config_(checked(std::move(config))),
      id_(id.empty() ? CryptoUtils::random_hex(16) : std::move(id)),
      created_at_(std::chrono::system_clock::now()),
      quality_gate_(*config_),
      rppg_(*config_),
      physics_(*config_),
      temporal_(*config_),
      spoof_(*config_),
      fusion_(*config_),
      rgb_buffer_(config_->rppg_buffer_capacity, config_->rppg_window_ms),
      green_series_(std::max(config_->static_window_samples, config_->flicker_window_samples)),
      temporal_buffer_(config_->temporal_buffer_capacity, config_->temporal_window_ms),
      corneal_buffer_(config_->corneal_window_frames),
      state_machine_(config_->decision_stable_frames)
{
    last_result_ = fresh_result();
    std::cout << "✓ [Session " << short_id(id_) << "] Created (rPPG: "
              << to_string(config_->rppg_method) << ")" << std::endl;
}

LivenessSession::LivenessSession(const LivenessConfig& config, std::string id)
    : LivenessSession(std::make_shared<const LivenessConfig>(config), std::move(id)) {
}

LivenessResult LivenessSession::fresh_result() const {
    LivenessResult r;
    r.details.rppg_method = config_->rppg_method;
    return r;
}

SubmitOutcome LivenessSession::reject(FrameStatus status, double timestamp_ms) {
    std::cerr << "⚠️  [Session " << short_id(id_) << "] Rejected frame @" << timestamp_ms
              << "ms: " << to_string(status) << std::endl;
    SubmitOutcome outcome;
    outcome.status = status;
    outcome.result = last_result_;
    return outcome;
}

SubmitOutcome LivenessSession::submit_frame(const cv::Mat& face, const cv::Mat& forehead,
                                            const std::string& stimulus_label, double timestamp_ms) {
    auto stimulus = parse_stimulus(stimulus_label);
    if (!stimulus) {
        return reject(FrameStatus::UNSUPPORTED_STIMULUS, timestamp_ms);
    }
    return submit_frame(FrameBox(face, forehead, *stimulus, timestamp_ms));
}

SubmitOutcome LivenessSession::submit_frame(const FrameBox& frame) {
    const double ts = frame.timestamp_ms;

    // Input malformation: skip without touching any buffer
    if (!frame.has_face() || !frame.has_forehead()) {
        return reject(FrameStatus::MISSING_ROI, ts);
    }
    if (!frame.has_valid_format()) {
        return reject(FrameStatus::INVALID_FORMAT, ts);
    }
    if (!std::isfinite(ts)) {
        return reject(FrameStatus::INVALID_TIMESTAMP, ts);
    }
    if (last_timestamp_ms_ && ts < *last_timestamp_ms_) {
        return reject(FrameStatus::NON_MONOTONIC_TIMESTAMP, ts);
    }

    const LivenessConfig& cfg = *config_;
    last_timestamp_ms_ = ts;
    if (!first_accepted_ms_) first_accepted_ms_ = ts;
    ++accepted_frames_;

    // Quality gate only decides what enters the rPPG buffer
    cv::Mat forehead_gray;
    cv::cvtColor(frame.forehead, forehead_gray, cv::COLOR_BGR2GRAY);
    const QualityVerdict verdict = quality_gate_.evaluate(forehead_gray, previous_forehead_gray_);
    previous_forehead_gray_ = forehead_gray;

    const cv::Scalar forehead_mean = cv::mean(frame.forehead);  // B, G, R
    green_series_.push({ts, forehead_mean[1]});
    if (verdict.passed) {
        rgb_buffer_.push({ts, forehead_mean[2], forehead_mean[1], forehead_mean[0]});
    }

    cv::Mat face_gray;
    cv::cvtColor(frame.face, face_gray, cv::COLOR_BGR2GRAY);
    if (cfg.enable_temporal_xcorr) {
        temporal_buffer_.push({ts, stimulus_intensity(frame.stimulus), cv::mean(face_gray)[0]});
    }

    if (frame.metadata.left_eye || frame.metadata.right_eye) {
        CornealSample sample;
        sample.timestamp_ms = ts;
        if (frame.metadata.left_eye) {
            sample.left = physics_.locate_eye(frame.face, *frame.metadata.left_eye);
        }
        if (frame.metadata.right_eye) {
            sample.right = physics_.locate_eye(frame.face, *frame.metadata.right_eye);
        }
        corneal_buffer_.push(sample);
    }

    FusionInputs in;
    in.rppg = rppg_.extract(rgb_buffer_.to_vector());
    in.rppg_buffer_size = rgb_buffer_.size();
    const std::optional<double> bpm = smoothed_bpm(in.rppg);
    in.bpm_stability_std = bpm_stability_std();

    SubsurfaceResult subsurface = physics_.probe_subsurface(frame);
    if (subsurface.evaluated) last_subsurface_ = subsurface;
    if (last_subsurface_) in.subsurface = *last_subsurface_;

    in.corneal = physics_.probe_corneal(corneal_buffer_.to_vector());
    in.chroma = physics_.check_chroma(frame.face, frame.stimulus);
    if (cfg.enable_temporal_xcorr) {
        in.temporal = temporal_.evaluate(temporal_buffer_.to_vector());
    }

    const std::vector<GreenSample> greens = green_series_.to_vector();
    in.texture = spoof_.check_texture(face_gray);
    in.flicker = spoof_.check_flicker(greens);
    in.moire = spoof_.check_moire(face_gray);
    in.variance = spoof_.check_variance(greens);
    in.geometry = spoof_.check_geometry(frame);

    const FusionDecision decision = fusion_.evaluate(in);
    const DecisionState state = state_machine_.update(warmup_complete(ts), decision.is_human);

    LivenessResult r = fresh_result();
    r.bpm = bpm;
    r.signal_quality = in.rppg.signal_quality.value_or(0.0);
    r.hrv_score = in.rppg.hrv.score;

    LivenessDetails& d = r.details;
    d.quality_gate = verdict.passed;
    d.quality_gate_reason = to_string(verdict.reason);
    d.chroma_passed = in.chroma.passed;
    d.physics_passed = in.subsurface.passed || in.corneal.passed;
    d.sss_ratio = in.subsurface.ratio;
    d.temporal_xcorr_passed = in.temporal.passed;
    d.temporal_xcorr_strength = in.temporal.strength;
    d.temporal_xcorr_delay_ms = in.temporal.delay_ms;
    d.is_static_image = in.variance.is_static;
    d.signal_variance = in.variance.signal_variance;
    d.lighting_unstable = in.variance.lighting_unstable;
    d.screen_texture_detected = in.texture.detected;
    d.texture_uniformity = in.texture.uniformity;
    d.screen_flicker_detected = in.flicker.detected;
    d.screen_flicker_ratio = in.flicker.ratio;

    d.decision_state = state;
    d.accepted_frames = accepted_frames_;
    d.rppg_samples = rgb_buffer_.size();
    d.temporal_samples = temporal_buffer_.size();
    d.bpm_raw = in.rppg.bpm;
    d.bpm_stability_std = in.bpm_stability_std;
    if (in.rppg.hrv.intervals >= 2) {
        d.hrv_rmssd_ms = in.rppg.hrv.rmssd_ms;
        d.hrv_sdnn_ms = in.rppg.hrv.sdnn_ms;
        d.hrv_entropy = in.rppg.hrv.entropy;
    }
    d.hrv_valid = in.rppg.hrv.biologically_valid;
    d.sss_passed = in.subsurface.passed;
    d.corneal_passed = in.corneal.passed;
    d.corneal_decoupling = in.corneal.decoupling;
    d.corneal_symmetry = in.corneal.symmetry;
    d.temporal_step_delay_ms = in.temporal.step_delay_ms;
    d.moire_detected = in.moire.detected;
    d.moire_score = in.moire.score;
    d.motion_score = verdict.features.motion_score;
    d.blur_variance = verdict.features.blur_variance;
    d.exposure_clip_fraction = verdict.features.exposure_clip_fraction;
    d.scores = decision.scores;

    if (state == DecisionState::WARMUP) {
        // Provisional only: no decision and no forced reason yet
        r.is_human = false;
        r.confidence = 0.0;
        d.provisional_forced_reason = decision.forced_false_reason;
        d.forced_false_reason.clear();
        d.scores["provisional_confidence"] = decision.confidence;
    } else {
        r.is_human = decision.is_human;
        r.confidence = decision.confidence;
        d.forced_false_reason = decision.forced_false_reason;

        if (!d.forced_false_reason.empty() && !hard_gate_logged_) {
            std::cerr << "⚠️  [Session " << short_id(id_) << "] Hard gate: "
                      << d.forced_false_reason << std::endl;
            hard_gate_logged_ = true;
        }
    }

    if (ENABLE_DEBUG_LOGGING) {
        std::cout << "[Session " << short_id(id_) << "] " << to_string(state)
                  << " conf=" << r.confidence << " gate=" << d.quality_gate_reason << std::endl;
    }

    last_result_ = r;
    SubmitOutcome outcome;
    outcome.status = FrameStatus::ACCEPTED;
    outcome.result = std::move(r);
    return outcome;
}

void LivenessSession::reset() {
    rgb_buffer_.clear();
    green_series_.clear();
    temporal_buffer_.clear();
    corneal_buffer_.clear();
    bpm_history_.clear();
    raw_bpm_history_.clear();
    previous_forehead_gray_.release();
    last_subsurface_.reset();
    last_timestamp_ms_.reset();
    first_accepted_ms_.reset();
    accepted_frames_ = 0;
    hard_gate_logged_ = false;
    state_machine_.reset();
    last_result_ = fresh_result();

    std::cout << "[Session " << short_id(id_) << "] Reset" << std::endl;
}

std::optional<double> LivenessSession::smoothed_bpm(const RppgResult& rppg) {
    if (!rppg.bpm) return std::nullopt;

    const double sqi = rppg.signal_quality.value_or(0.0);
    bpm_history_.emplace_back(*rppg.bpm, sqi);
    while (bpm_history_.size() > config_->bpm_history_size) bpm_history_.pop_front();

    raw_bpm_history_.push_back(*rppg.bpm);
    while (raw_bpm_history_.size() > config_->bpm_stability_history_size) raw_bpm_history_.pop_front();

    // SQI-weighted mean of recent estimates
    double weighted = 0.0, weight = 0.0;
    for (const auto& entry : bpm_history_) {
        weighted += entry.first * entry.second;
        weight += entry.second;
    }
    if (weight <= 0.0) return *rppg.bpm;
    return weighted / weight;
}

std::optional<double> LivenessSession::bpm_stability_std() const {
    if (raw_bpm_history_.size() < config_->bpm_stability_min_samples) return std::nullopt;
    return dsp::stddev(std::vector<double>(raw_bpm_history_.begin(), raw_bpm_history_.end()));
}

bool LivenessSession::warmup_complete(double timestamp_ms) const {
    if (!first_accepted_ms_) return false;
    return accepted_frames_ >= config_->warmup_min_frames &&
           timestamp_ms - *first_accepted_ms_ >= config_->warmup_min_ms;
}

} // namespace prism
