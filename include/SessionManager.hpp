#pragma once

#include "FrameBox.hpp"
#include "LivenessConfig.hpp"
#include "LivenessResult.hpp"
#include "LivenessSession.hpp"
#include "StatsService.hpp"
#include "WorkerPool.hpp"

#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prism {

/**
 * @brief Owns concurrent liveness sessions
 *
 * Frames for one session run strictly in arrival order: each session has
 * its own FIFO that at most one pool task drains at a time. Different
 * sessions run in parallel on the worker pool. The config is validated
 * once and shared read-only.
 */
class SessionManager {
public:
    /**
     * @param worker_threads Pool size (0 = hardware concurrency)
     * @param stats_interval_ms Periodic stats logging interval (0 = off)
     * @throws std::invalid_argument on an invalid config
     */
    explicit SessionManager(const LivenessConfig& config,
                            size_t worker_threads = 0,
                            int stats_interval_ms = 0);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Create a session and return its id
     */
    std::string create_session();

    /**
     * @brief Queue a frame for asynchronous processing
     *
     * The future fails with std::out_of_range for an unknown session id.
     */
    std::future<SubmitOutcome> submit_frame(const std::string& session_id, FrameBox frame);

    /**
     * @brief Queue a frame and wait for its outcome
     * @return std::nullopt for an unknown session id
     */
    std::optional<SubmitOutcome> submit_frame_sync(const std::string& session_id, FrameBox frame);

    /**
     * @brief Reset a session; frames already queued still run afterwards
     */
    bool reset_session(const std::string& session_id);

    std::optional<LivenessResult> last_result(const std::string& session_id) const;

    std::optional<DecisionState> session_state(const std::string& session_id) const;

    /**
     * @brief Drop a session; queued frames finish on their own copy
     */
    bool end_session(const std::string& session_id);

    size_t session_count() const;

    std::vector<std::string> session_ids() const;

    /**
     * @brief Block until every queued frame has been processed
     */
    void wait_idle() const { pool_.wait_idle(); }

    const StatsService& stats() const { return stats_; }
    const LivenessConfig& config() const { return *config_; }

private:
    struct PendingFrame {
        FrameBox frame;
        std::shared_ptr<std::promise<SubmitOutcome>> promise;
    };

    struct SessionSlot {
        explicit SessionSlot(std::shared_ptr<const LivenessConfig> config)
            : session(std::move(config)) {}

        mutable std::mutex session_mutex;   // Guards session
        LivenessSession session;

        std::mutex queue_mutex;             // Guards queue and draining
        std::deque<PendingFrame> queue;
        bool draining = false;
    };

    std::shared_ptr<const LivenessConfig> config_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionSlot>> sessions_;

    StatsService stats_;
    WorkerPool pool_;   // Last member: joins workers before the rest is destroyed

    std::shared_ptr<SessionSlot> find(const std::string& session_id) const;
    void drain(std::shared_ptr<SessionSlot> slot);
    SubmitOutcome process(SessionSlot& slot, const FrameBox& frame);
};

} // namespace prism
