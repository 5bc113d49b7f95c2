#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

namespace prism {

/**
 * @brief Centralized statistics service
 *
 * Thread-safe counters shared by every session of a SessionManager, with
 * optional periodic logging. Designed for minimal overhead in the hot path.
 */
class StatsService {
public:
    // Aggregate stats
    struct Summary {
        uint64_t sessions_created;
        uint64_t frames_submitted;
        uint64_t frames_rejected;
        uint64_t quality_gate_failures;
        uint64_t hard_gate_frames;
        uint64_t human_decisions;
        double avg_processing_ms;
        double max_processing_ms;
    };

    StatsService() : running_(false), log_interval_ms_(1000) {}

    ~StatsService() {
        stop();
    }

    StatsService(const StatsService&) = delete;
    StatsService& operator=(const StatsService&) = delete;

    void start(int log_interval_ms = 1000) {
        if (running_) return;
        log_interval_ms_ = log_interval_ms;
        running_ = true;
        logger_thread_ = std::thread(&StatsService::logger_loop, this);
        std::cout << "📊 StatsService started (interval: " << log_interval_ms << "ms)" << std::endl;
    }

    void stop() {
        if (running_) {
            {
                std::lock_guard<std::mutex> lock(cv_mutex_);
                running_ = false;
            }
            cv_.notify_all();
            if (logger_thread_.joinable()) {
                logger_thread_.join();
            }
            std::cout << "📊 StatsService stopped" << std::endl;
        }
    }

    // === Hot path methods (lock-free) ===

    void record_session_created() {
        sessions_created_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_rejected() {
        frames_submitted_.fetch_add(1, std::memory_order_relaxed);
        frames_rejected_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_frame(bool quality_passed, bool hard_gate, bool is_human, uint32_t processing_us) {
        frames_submitted_.fetch_add(1, std::memory_order_relaxed);
        if (!quality_passed) quality_gate_failures_.fetch_add(1, std::memory_order_relaxed);
        if (hard_gate) hard_gate_frames_.fetch_add(1, std::memory_order_relaxed);
        if (is_human) human_decisions_.fetch_add(1, std::memory_order_relaxed);

        processed_frames_.fetch_add(1, std::memory_order_relaxed);
        total_processing_us_.fetch_add(processing_us, std::memory_order_relaxed);

        uint32_t prev = max_processing_us_.load(std::memory_order_relaxed);
        while (processing_us > prev &&
               !max_processing_us_.compare_exchange_weak(prev, processing_us,
                                                         std::memory_order_relaxed)) {
        }
    }

    // === Query methods ===

    Summary get_summary() const {
        Summary s;
        s.sessions_created = sessions_created_.load(std::memory_order_relaxed);
        s.frames_submitted = frames_submitted_.load(std::memory_order_relaxed);
        s.frames_rejected = frames_rejected_.load(std::memory_order_relaxed);
        s.quality_gate_failures = quality_gate_failures_.load(std::memory_order_relaxed);
        s.hard_gate_frames = hard_gate_frames_.load(std::memory_order_relaxed);
        s.human_decisions = human_decisions_.load(std::memory_order_relaxed);

        const uint64_t processed = processed_frames_.load(std::memory_order_relaxed);
        const uint64_t total_us = total_processing_us_.load(std::memory_order_relaxed);
        s.avg_processing_ms = processed > 0 ? (static_cast<double>(total_us) / processed) / 1000.0 : 0.0;
        s.max_processing_ms = max_processing_us_.load(std::memory_order_relaxed) / 1000.0;
        return s;
    }

    static void print_summary(const Summary& summary, std::ostream& os = std::cout) {
        const std::ios_base::fmtflags flags = os.flags();
        const std::streamsize precision = os.precision();
        os << "📊 STATS | "
           << "Sessions: " << summary.sessions_created
           << " | Frames: " << summary.frames_submitted
           << " | Rejected: " << summary.frames_rejected
           << " | Gate fail: " << summary.quality_gate_failures
           << " | Hard gate: " << summary.hard_gate_frames
           << " | Human: " << summary.human_decisions
           << " | Avg: " << std::fixed << std::setprecision(2) << summary.avg_processing_ms << "ms"
           << " | Max: " << std::setprecision(2) << summary.max_processing_ms << "ms"
           << std::endl;
        os.flags(flags);
        os.precision(precision);
    }

private:
    std::atomic<bool> running_;
    int log_interval_ms_;

    // Atomic counters (lock-free)
    std::atomic<uint64_t> sessions_created_{0};
    std::atomic<uint64_t> frames_submitted_{0};
    std::atomic<uint64_t> frames_rejected_{0};
    std::atomic<uint64_t> quality_gate_failures_{0};
    std::atomic<uint64_t> hard_gate_frames_{0};
    std::atomic<uint64_t> human_decisions_{0};
    std::atomic<uint64_t> processed_frames_{0};
    std::atomic<uint64_t> total_processing_us_{0};
    std::atomic<uint32_t> max_processing_us_{0};

    // Logger thread
    std::thread logger_thread_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    void logger_loop() {
        std::unique_lock<std::mutex> lock(cv_mutex_);
        while (running_) {
            cv_.wait_for(lock, std::chrono::milliseconds(log_interval_ms_),
                         [this] { return !running_; });

            if (!running_) break;

            print_summary(get_summary());
        }
    }
};

} // namespace prism
