#include "RingBuffer.hpp"
#include <iostream>
#include <stdexcept>

using namespace prism;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

struct Sample {
    double timestamp_ms = 0.0;
    int value = 0;
};

int main() {
    std::cout << "=== TimedRingBuffer Test ===" << std::endl;

    // Test 1: Capacity eviction keeps the newest entries, oldest at index 0
    {
        TimedRingBuffer<Sample> rb(4);
        for (int i = 0; i < 7; ++i) {
            rb.push({i * 10.0, i});
        }
        assert_true(rb.size() == 4, "size capped at capacity");
        assert_true(rb.front().value == 3, "oldest surviving entry at index 0");
        assert_true(rb.back().value == 6, "newest entry at the back");
        assert_true(rb.total_pushed() == 7, "push counter counts every push");
        assert_true(rb.total_evicted() == 3, "evictions equal pushes beyond capacity");

        auto v = rb.to_vector();
        bool ordered = v.size() == 4;
        for (size_t i = 1; i < v.size(); ++i) {
            ordered = ordered && v[i - 1].timestamp_ms <= v[i].timestamp_ms;
        }
        assert_true(ordered, "to_vector() is oldest-first");
    }

    // Test 2: Time window evicts entries older than window_ms
    {
        TimedRingBuffer<Sample> rb(100, 1000.0);
        for (int i = 0; i <= 30; ++i) {
            rb.push({i * 100.0, i});
        }
        assert_true(rb.span_ms() <= 1000.0, "span never exceeds the window");
        assert_true(rb.front().timestamp_ms == 2000.0, "oldest entry is exactly window_ms old");
        assert_true(rb.size() == 11, "11 entries cover 1000 ms at 100 ms spacing");
    }

    // Test 3: tail() returns the last n, clamped to size
    {
        TimedRingBuffer<Sample> rb(8);
        for (int i = 0; i < 5; ++i) rb.push({i * 1.0, i});
        auto t = rb.tail(2);
        assert_true(t.size() == 2 && t[0].value == 3 && t[1].value == 4, "tail(2) gives the two newest");
        assert_true(rb.tail(50).size() == 5, "tail(n) clamps to size");
    }

    // Test 4: at() bounds checking
    {
        TimedRingBuffer<Sample> rb(2);
        bool threw = false;
        try {
            rb.at(0);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert_true(threw, "at() on an empty buffer throws out_of_range");
    }

    // Test 5: clear() empties and resets counters
    {
        TimedRingBuffer<Sample> rb(3, 500.0);
        for (int i = 0; i < 6; ++i) rb.push({i * 10.0, i});
        rb.clear();
        assert_true(rb.empty(), "clear() empties the buffer");
        assert_true(rb.total_pushed() == 0 && rb.total_evicted() == 0, "clear() resets counters");
        assert_true(rb.capacity() == 3 && rb.window_ms() == 500.0, "clear() keeps capacity and window");
        rb.push({1000.0, 1});
        assert_true(rb.size() == 1 && rb.span_ms() == 0.0, "buffer usable after clear()");
    }

    // Test 6: Zero capacity is rejected
    {
        bool threw = false;
        try {
            TimedRingBuffer<Sample> rb(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert_true(threw, "zero capacity throws invalid_argument");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
