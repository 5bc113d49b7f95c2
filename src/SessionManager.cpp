#include "SessionManager.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace prism {

SessionManager::SessionManager(const LivenessConfig& config,
                               size_t worker_threads,
                               int stats_interval_ms)
    : config_(std::make_shared<const LivenessConfig>(config)),
      pool_(worker_threads)
{
    config_->validate();
    if (stats_interval_ms > 0) {
        stats_.start(stats_interval_ms);
    }
    std::cout << "✓ [SessionManager] Started with " << pool_.thread_count()
              << " workers (rPPG: " << to_string(config_->rppg_method) << ")" << std::endl;
}

SessionManager::~SessionManager() {
    pool_.shutdown();
    stats_.stop();
    std::cout << "[SessionManager] Stopped after " << pool_.tasks_run() << " drain tasks, "
              << session_count() << " sessions open" << std::endl;
    StatsService::print_summary(stats_.get_summary());
}

std::shared_ptr<SessionManager::SessionSlot> SessionManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

std::string SessionManager::create_session() {
    auto slot = std::make_shared<SessionSlot>(config_);
    std::string id = slot->session.id();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace(id, std::move(slot));
    }
    stats_.record_session_created();
    return id;
}

std::future<SubmitOutcome> SessionManager::submit_frame(const std::string& session_id, FrameBox frame) {
    auto promise = std::make_shared<std::promise<SubmitOutcome>>();
    std::future<SubmitOutcome> future = promise->get_future();

    auto slot = find(session_id);
    if (!slot) {
        promise->set_exception(std::make_exception_ptr(
            std::out_of_range("Unknown session: " + session_id)));
        return future;
    }

    bool start_drain = false;
    {
        std::lock_guard<std::mutex> lock(slot->queue_mutex);
        slot->queue.push_back(PendingFrame{std::move(frame), promise});
        if (!slot->draining) {
            slot->draining = true;
            start_drain = true;
        }
    }

    if (start_drain) {
        try {
            pool_.post([this, slot] { drain(slot); });
        } catch (const std::runtime_error&) {
            // Pool is shutting down: queued promises break
            std::lock_guard<std::mutex> lock(slot->queue_mutex);
            slot->draining = false;
            slot->queue.clear();
            throw;
        }
    }
    return future;
}

std::optional<SubmitOutcome> SessionManager::submit_frame_sync(const std::string& session_id, FrameBox frame) {
    if (!find(session_id)) return std::nullopt;
    try {
        return submit_frame(session_id, std::move(frame)).get();
    } catch (const std::out_of_range& e) {
        // Ended between lookup and submission
        std::cerr << "⚠️  [SessionManager] " << e.what() << std::endl;
        return std::nullopt;
    }
}

void SessionManager::drain(std::shared_ptr<SessionSlot> slot) {
    while (true) {
        PendingFrame job;
        {
            std::lock_guard<std::mutex> lock(slot->queue_mutex);
            if (slot->queue.empty()) {
                slot->draining = false;
                return;
            }
            job = std::move(slot->queue.front());
            slot->queue.pop_front();
        }

        try {
            job.promise->set_value(process(*slot, job.frame));
        } catch (const std::exception& e) {
            std::cerr << "⚠️  [SessionManager] Frame processing failed: " << e.what() << std::endl;
            job.promise->set_exception(std::current_exception());
        }
    }
}

SubmitOutcome SessionManager::process(SessionSlot& slot, const FrameBox& frame) {
    const auto start = std::chrono::steady_clock::now();

    SubmitOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(slot.session_mutex);
        outcome = slot.session.submit_frame(frame);
    }

    const auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!outcome.accepted()) {
        stats_.record_rejected();
    } else {
        const LivenessDetails& d = outcome.result.details;
        stats_.record_frame(d.quality_gate, !d.forced_false_reason.empty(),
                            outcome.result.is_human, static_cast<uint32_t>(elapsed_us));
    }
    return outcome;
}

bool SessionManager::reset_session(const std::string& session_id) {
    auto slot = find(session_id);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->session_mutex);
    slot->session.reset();
    return true;
}

std::optional<LivenessResult> SessionManager::last_result(const std::string& session_id) const {
    auto slot = find(session_id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->session_mutex);
    return slot->session.last_result();
}

std::optional<DecisionState> SessionManager::session_state(const std::string& session_id) const {
    auto slot = find(session_id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->session_mutex);
    return slot->session.state();
}

bool SessionManager::end_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.erase(session_id) > 0;
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionManager::session_ids() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& kv : sessions_) ids.push_back(kv.first);
    return ids;
}

} // namespace prism
