#pragma once

#include "LivenessConfig.hpp"
#include "LivenessResult.hpp"
#include "PhysicsProbes.hpp"
#include "RppgExtractor.hpp"
#include "SpoofDetector.hpp"
#include "TemporalValidator.hpp"

#include <map>
#include <optional>
#include <string>

namespace prism {

/**
 * @brief Everything fusion looks at for one update
 */
struct FusionInputs {
    RppgResult rppg;
    size_t rppg_buffer_size = 0;
    std::optional<double> bpm_stability_std;
    SubsurfaceResult subsurface;   // Last evaluated, may be stale
    CornealResult corneal;
    ChromaResult chroma;
    TemporalResult temporal;
    TextureResult texture;
    FlickerResult flicker;
    MoireResult moire;
    VarianceResult variance;
    GeometryResult geometry;
};

struct FusionDecision {
    bool is_human = false;
    double confidence = 0.0;
    std::string forced_false_reason;          // Empty unless a hard gate fired
    std::map<std::string, double> scores;     // Per-signal contributions
};

/**
 * @brief Fusion & Decision
 *
 * Hard gates short-circuit before any weighting, so retuning weights can
 * never dilute a screen or geometry detection. Continuous signals are
 * summed as weighted evidence; no single one is required.
 */
class FusionEngine {
public:
    explicit FusionEngine(const LivenessConfig& config);

    FusionDecision evaluate(const FusionInputs& in) const;

    /**
     * @brief First hard gate that fires, in priority order
     */
    std::optional<std::string> hard_gate(const FusionInputs& in) const;

    /**
     * @brief Weighted evidence score, clamped to 0-100
     * @param scores Receives each non-zero contribution
     */
    double weighted_score(const FusionInputs& in, std::map<std::string, double>& scores) const;

private:
    LivenessConfig config_;
};

/**
 * @brief WARMUP -> ACTIVE -> DECIDED tracking
 */
class DecisionStateMachine {
public:
    explicit DecisionStateMachine(size_t stable_frames);

    /**
     * @brief Advance with one fusion update
     * @param warmup_complete Warmup criteria met
     * @param is_human Decision of this update (ignored during warmup)
     */
    DecisionState update(bool warmup_complete, bool is_human);

    void reset();

    DecisionState state() const { return state_; }
    size_t stable_count() const { return stable_count_; }

private:
    size_t stable_frames_;
    DecisionState state_ = DecisionState::WARMUP;
    std::optional<bool> last_decision_;
    size_t stable_count_ = 0;
};

} // namespace prism
