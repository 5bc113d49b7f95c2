#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace prism {

/**
 * @brief Fixed-capacity, time-ordered ring buffer
 *
 * Features:
 * - O(1) append; the oldest entry is overwritten once capacity is reached
 * - Entries older than window_ms (relative to the newest entry) are evicted
 * - Index 0 is always the oldest entry
 *
 * T must expose a `double timestamp_ms` member. Callers are responsible
 * for appending in non-decreasing timestamp order. Not thread-safe: a
 * buffer belongs to exactly one session.
 */
template <typename T>
class TimedRingBuffer {
public:
    explicit TimedRingBuffer(size_t capacity, double window_ms = 0.0)
        : slots_(capacity), window_ms_(window_ms) {
        if (capacity == 0) {
            throw std::invalid_argument("TimedRingBuffer capacity must be positive");
        }
    }

    void push(const T& item) {
        if (size_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --size_;
            ++total_evicted_;
        }
        slots_[(head_ + size_) % slots_.size()] = item;
        ++size_;
        ++total_pushed_;

        if (window_ms_ > 0.0) {
            const double newest = back().timestamp_ms;
            while (size_ > 1 && newest - front().timestamp_ms > window_ms_) {
                head_ = (head_ + 1) % slots_.size();
                --size_;
                ++total_evicted_;
            }
        }
    }

    const T& operator[](size_t index) const {
        return slots_[(head_ + index) % slots_.size()];
    }

    const T& at(size_t index) const {
        if (index >= size_) {
            throw std::out_of_range("TimedRingBuffer index out of range");
        }
        return (*this)[index];
    }

    const T& front() const { return at(0); }
    const T& back() const { return at(size_ - 1); }

    /**
     * @brief Copy of the last n entries (oldest first)
     */
    std::vector<T> tail(size_t n) const {
        n = std::min(n, size_);
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = size_ - n; i < size_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

    std::vector<T> to_vector() const { return tail(size_); }

    /**
     * @brief Time span between oldest and newest entry
     */
    double span_ms() const {
        return size_ < 2 ? 0.0 : back().timestamp_ms - front().timestamp_ms;
    }

    void clear() {
        head_ = 0;
        size_ = 0;
        total_pushed_ = 0;
        total_evicted_ = 0;
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    size_t capacity() const { return slots_.size(); }
    double window_ms() const { return window_ms_; }
    uint64_t total_pushed() const { return total_pushed_; }
    uint64_t total_evicted() const { return total_evicted_; }

private:
    std::vector<T> slots_;
    double window_ms_;
    size_t head_ = 0;
    size_t size_ = 0;

    uint64_t total_pushed_ = 0;
    uint64_t total_evicted_ = 0;
};

} // namespace prism
