#include "TemporalValidator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

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

// Uneven holds: 0.2 for 700 ms, 0.9 for 500 ms, 0.5 for 900 ms, 1.0 for 600 ms
static double stimulus_at(double t_ms) {
    double t = std::fmod(std::max(0.0, t_ms), 2700.0);
    if (t < 700.0) return 0.2;
    if (t < 1200.0) return 0.9;
    if (t < 2100.0) return 0.5;
    return 1.0;
}

static std::vector<TemporalSample> series(double delay_ms, size_t n = 120, double fps = 30.0) {
    std::vector<TemporalSample> out;
    for (size_t i = 0; i < n; ++i) {
        const double t = i * 1000.0 / fps;
        out.push_back({t, stimulus_at(t), 100.0 + 50.0 * stimulus_at(t - delay_ms)});
    }
    return out;
}

int main() {
    std::cout << "=== TemporalValidator Test ===" << std::endl;

    LivenessConfig config;
    TemporalValidator validator(config);

    // Biological delay passes
    {
        TemporalResult r = validator.evaluate(series(180.0));
        std::cout << "  delay=" << r.delay_ms.value_or(-1) << " strength=" << r.strength.value_or(-1) << std::endl;
        assert_true(r.evaluated, "4 s of samples is evaluated");
        assert_true(r.delay_ms && *r.delay_ms >= 150.0 && *r.delay_ms <= 210.0, "xcorr lag near 180 ms");
        assert_true(r.strength && *r.strength > 0.8, "delayed copy correlates strongly");
        assert_true(r.passed, "180 ms response passes");
        assert_true(r.step_delay_ms && *r.step_delay_ms >= 150.0 && *r.step_delay_ms <= 250.0,
                    "step response delay near 180 ms");
    }

    // Instant response (screen replay) fails
    {
        TemporalResult r = validator.evaluate(series(0.0));
        assert_true(r.evaluated, "zero-lag series is evaluated");
        assert_true(r.delay_ms && *r.delay_ms == 0.0, "zero-lag series peaks at lag 0");
        assert_true(r.strength && *r.strength > 0.99, "zero-lag series correlates perfectly");
        assert_true(!r.passed, "zero-lag response fails");
    }

    // Response later than the biological window fails
    {
        TemporalResult r = validator.evaluate(series(450.0));
        assert_true(r.delay_ms && *r.delay_ms > config.response_delay_max_ms, "450 ms lag found");
        assert_true(!r.passed, "450 ms response fails");
    }

    // Non-reactive source
    {
        auto s = series(180.0);
        for (auto& sample : s) sample.response = 120.0;
        TemporalResult r = validator.evaluate(s);
        assert_true(r.evaluated && r.strength && *r.strength == 0.0, "constant response has zero strength");
        assert_true(!r.passed, "constant response fails");
    }

    // Nothing displayed
    {
        auto s = series(180.0);
        for (auto& sample : s) sample.stimulus = 0.5;
        TemporalResult r = validator.evaluate(s);
        assert_true(!r.evaluated && !r.passed, "constant stimulus is not evaluated");
    }

    // Too few samples
    {
        TemporalResult r = validator.evaluate(series(180.0, 20));
        assert_true(!r.evaluated && r.samples == 20, "short series is not evaluated");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
