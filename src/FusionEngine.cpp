#include "FusionEngine.hpp"

#include <algorithm>
#include <iostream>

// Debug logging flag - set to false for production to avoid hot-path logging
#define ENABLE_DEBUG_LOGGING false

namespace prism {

namespace {

constexpr double kSssMarginScale = 0.15;     // Ratio margin for full subsurface credit
constexpr double kSssMinCredit = 0.5;
constexpr double kSssPartialCredit = 0.3;
constexpr double kTemporalStrengthScale = 15.0;
constexpr double kBpmInstabilitySlope = 1.5;
constexpr size_t kRppgWarmupSamples = 30;

} // namespace

FusionEngine::FusionEngine(const LivenessConfig& config) : config_(config) {
}

std::optional<std::string> FusionEngine::hard_gate(const FusionInputs& in) const {
    if (!in.geometry.valid) {
        return "impossible_geometry:" + in.geometry.detail;
    }
    if (in.texture.detected) {
        return std::string("screen_texture_detected");
    }
    if (config_.static_image_hard_gate && in.variance.evaluated && in.variance.is_static) {
        return std::string("static_image_low_variance");
    }
    if (config_.flicker_hard_gate && in.flicker.evaluated && in.flicker.detected) {
        return std::string("screen_flicker_detected");
    }
    return std::nullopt;
}

double FusionEngine::weighted_score(const FusionInputs& in,
                                    std::map<std::string, double>& scores) const {
    const FusionWeights& w = config_.weights;
    double score = 0.0;

    auto add = [&score, &scores](const char* name, double points) {
        score += points;
        scores[name] = points;
    };

    // 1. rPPG, scaled by signal quality
    if (in.rppg.is_valid()) {
        add("rppg", w.rppg * in.rppg.signal_quality.value_or(0.0));
    } else if (in.rppg_buffer_size > kRppgWarmupSamples) {
        add("rppg_warmup_bonus", w.rppg_warmup_bonus);
    }

    // 2. HRV irregularity
    if (in.rppg.hrv.biologically_valid) {
        add("hrv", w.hrv);
    }

    // 3. Subsurface scattering, scaled by margin above the lower bound
    if (in.subsurface.passed && in.subsurface.ratio) {
        double credit = std::min(1.0, (*in.subsurface.ratio - config_.sss_min_ratio) / kSssMarginScale);
        credit = std::max(kSssMinCredit, credit);
        add("physics_sss", w.physics_sss * credit);
    } else if (in.subsurface.ratio &&
               *in.subsurface.ratio > config_.sss_min_ratio - kSssMarginScale &&
               *in.subsurface.ratio < config_.sss_max_ratio) {
        add("physics_sss_partial", w.physics_sss * kSssPartialCredit);
    }

    // 4. Corneal glint decoupling, symmetry only supports it
    if (in.corneal.passed) {
        add("corneal", w.corneal);
        if (in.corneal.symmetry_passed) {
            add("corneal_symmetry", w.corneal_symmetry_bonus);
        }
    }

    // 5. Chroma sync
    if (in.chroma.passed) {
        add("chroma", w.chroma);
    }

    // 6. Temporal response
    if (in.temporal.passed) {
        const double bonus = std::min(w.temporal_strength_bonus,
                                      in.temporal.strength.value_or(0.0) * kTemporalStrengthScale);
        add("temporal", w.temporal + bonus);
    }

    // 7. Moire
    if (in.moire.evaluated) {
        if (in.moire.detected) {
            add("moire_penalty", -w.moire_penalty);
        } else {
            add("moire", w.moire_bonus);
        }
    }

    // 8. BPM stability
    if (in.bpm_stability_std && *in.bpm_stability_std > config_.bpm_stability_max_std) {
        const double penalty = std::min(w.bpm_instability_max_penalty,
                                        (*in.bpm_stability_std - config_.bpm_stability_max_std) *
                                            kBpmInstabilitySlope);
        add("bpm_stability_penalty", -penalty);
    }

    // 9. Static image / lighting
    if (in.variance.evaluated) {
        if (in.variance.lighting_unstable) {
            add("lighting_penalty", -w.lighting_penalty);
        }
        if (in.variance.is_static) {
            add("static_image_penalty", -w.static_penalty);
        } else {
            add("alive_bonus", w.alive_bonus);
        }
    }

    // 10. Screen flicker
    if (in.flicker.evaluated && in.flicker.detected) {
        add("screen_flicker_penalty", -w.flicker_penalty);
    }

    return std::clamp(score, 0.0, 100.0);
}

FusionDecision FusionEngine::evaluate(const FusionInputs& in) const {
    FusionDecision decision;

    if (auto reason = hard_gate(in)) {
        decision.is_human = false;
        decision.confidence = 0.0;
        decision.forced_false_reason = *reason;
        if (ENABLE_DEBUG_LOGGING) {
            std::cout << "[Fusion] hard gate: " << *reason << std::endl;
        }
        return decision;
    }

    decision.confidence = weighted_score(in, decision.scores);
    decision.is_human = decision.confidence >= config_.decision_threshold;

    if (ENABLE_DEBUG_LOGGING) {
        std::cout << "[Fusion] confidence=" << decision.confidence
                  << (decision.is_human ? " HUMAN" : " NOT HUMAN") << std::endl;
    }
    return decision;
}

DecisionStateMachine::DecisionStateMachine(size_t stable_frames)
    : stable_frames_(stable_frames) {
}

DecisionState DecisionStateMachine::update(bool warmup_complete, bool is_human) {
    if (state_ == DecisionState::WARMUP) {
        if (!warmup_complete) return state_;
        state_ = DecisionState::ACTIVE;
    }

    if (last_decision_ && *last_decision_ == is_human) {
        ++stable_count_;
    } else {
        last_decision_ = is_human;
        stable_count_ = 1;
    }

    state_ = stable_count_ >= stable_frames_ ? DecisionState::DECIDED : DecisionState::ACTIVE;
    return state_;
}

void DecisionStateMachine::reset() {
    state_ = DecisionState::WARMUP;
    last_decision_.reset();
    stable_count_ = 0;
}

} // namespace prism
