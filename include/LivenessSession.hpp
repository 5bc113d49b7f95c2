#pragma once

#include "FrameBox.hpp"
#include "FusionEngine.hpp"
#include "LivenessConfig.hpp"
#include "LivenessResult.hpp"
#include "PhysicsProbes.hpp"
#include "QualityGate.hpp"
#include "RingBuffer.hpp"
#include "RppgExtractor.hpp"
#include "SpoofDetector.hpp"
#include "TemporalValidator.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace prism {

/**
 * @brief Outcome of submitting one frame at the session boundary
 */
enum class FrameStatus {
    ACCEPTED,
    MISSING_ROI,              // Empty or zero-size face/forehead ROI
    INVALID_FORMAT,           // Not 8-bit 3-channel BGR
    INVALID_TIMESTAMP,        // NaN or infinite
    NON_MONOTONIC_TIMESTAMP,  // Earlier than the previous accepted frame
    UNSUPPORTED_STIMULUS      // Label outside the palette
};

const char* to_string(FrameStatus status);

struct SubmitOutcome {
    FrameStatus status = FrameStatus::ACCEPTED;
    LivenessResult result;   // Unchanged last result when rejected

    bool accepted() const { return status == FrameStatus::ACCEPTED; }
};

/**
 * @brief One verification attempt
 *
 * The only stateful object in the engine: owns every rolling buffer and
 * processes frames synchronously in submission order. Not thread-safe;
 * SessionManager serializes access when sessions are driven from a pool.
 */
class LivenessSession {
public:
    explicit LivenessSession(std::shared_ptr<const LivenessConfig> config,
                             std::string id = "");
    explicit LivenessSession(const LivenessConfig& config, std::string id = "");

    LivenessSession(const LivenessSession&) = delete;
    LivenessSession& operator=(const LivenessSession&) = delete;

    /**
     * @brief Process one frame
     *
     * Malformed frames are rejected without touching any buffer.
     */
    SubmitOutcome submit_frame(const FrameBox& frame);

    /**
     * @brief Convenience overload taking a stimulus label
     */
    SubmitOutcome submit_frame(const cv::Mat& face, const cv::Mat& forehead,
                               const std::string& stimulus_label, double timestamp_ms);

    /**
     * @brief Clear every buffer and re-enter WARMUP
     */
    void reset();

    const LivenessResult& last_result() const { return last_result_; }
    DecisionState state() const { return state_machine_.state(); }
    const std::string& id() const { return id_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }
    const LivenessConfig& config() const { return *config_; }

    size_t accepted_frames() const { return accepted_frames_; }
    size_t rppg_buffer_size() const { return rgb_buffer_.size(); }
    size_t temporal_buffer_size() const { return temporal_buffer_.size(); }
    size_t corneal_buffer_size() const { return corneal_buffer_.size(); }
    size_t spoof_series_size() const { return green_series_.size(); }

private:
    std::shared_ptr<const LivenessConfig> config_;
    std::string id_;
    std::chrono::system_clock::time_point created_at_;

    // Stateless components
    QualityGate quality_gate_;
    RppgExtractor rppg_;
    PhysicsProbes physics_;
    TemporalValidator temporal_;
    SpoofDetector spoof_;
    FusionEngine fusion_;

    // Rolling state
    TimedRingBuffer<RgbSample> rgb_buffer_;          // Quality-gated forehead color
    TimedRingBuffer<GreenSample> green_series_;      // Every valid frame, for spoof checks
    TimedRingBuffer<TemporalSample> temporal_buffer_;
    TimedRingBuffer<CornealSample> corneal_buffer_;
    std::deque<std::pair<double, double>> bpm_history_;  // (bpm, sqi)
    std::deque<double> raw_bpm_history_;
    cv::Mat previous_forehead_gray_;
    std::optional<SubsurfaceResult> last_subsurface_;
    std::optional<double> last_timestamp_ms_;
    std::optional<double> first_accepted_ms_;
    size_t accepted_frames_ = 0;
    bool hard_gate_logged_ = false;

    DecisionStateMachine state_machine_;
    LivenessResult last_result_;

    SubmitOutcome reject(FrameStatus status, double timestamp_ms);
    LivenessResult fresh_result() const;
    std::optional<double> smoothed_bpm(const RppgResult& rppg);
    std::optional<double> bpm_stability_std() const;
    bool warmup_complete(double timestamp_ms) const;
};

} // namespace prism
