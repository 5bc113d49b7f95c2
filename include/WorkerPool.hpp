#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace prism {

/**
 * @brief Fixed-size pool running session drain tasks
 *
 * Frames of different sessions run on different workers. Ordering inside
 * one session is kept by SessionManager, which posts at most one drain
 * task per session at a time.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&WorkerPool::run, this);
        }
    }

    ~WorkerPool() {
        shutdown();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task for the next free worker
     * @throws std::runtime_error after shutdown()
     */
    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("WorkerPool is shut down");
            }
            pending_.push(std::move(task));
        }
        work_cv_.notify_one();
    }

    /**
     * @brief Block until the queue is empty and no worker is busy
     */
    void wait_idle() const {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return pending_.empty() && busy_ == 0; });
    }

    // Drains what is queued, then joins. Safe to call twice.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            stopping_ = true;
        }
        work_cv_.notify_all();
        for (std::thread& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    size_t thread_count() const { return workers_.size(); }
    uint64_t tasks_run() const { return tasks_run_.load(); }

private:
    void run() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                if (pending_.empty()) return;   // stopping and nothing left
                task = std::move(pending_.front());
                pending_.pop();
                ++busy_;
            }

            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "⚠️  [WorkerPool] Task threw: " << e.what() << std::endl;
            }
            tasks_run_++;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --busy_;
                if (pending_.empty() && busy_ == 0) idle_cv_.notify_all();
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<Task> pending_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    mutable std::condition_variable idle_cv_;
    size_t busy_ = 0;
    bool stopping_ = false;

    std::atomic<uint64_t> tasks_run_{0};
};

} // namespace prism
