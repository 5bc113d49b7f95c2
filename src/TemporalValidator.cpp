#include "TemporalValidator.hpp"
#include "SignalProcessing.hpp"

#include <cmath>
#include <iostream>

// Debug logging flag - set to false for production to avoid hot-path logging
#define ENABLE_DEBUG_LOGGING false

namespace prism {

namespace {

constexpr size_t kMinOverlapSamples = 10;
constexpr size_t kStepBaselineSamples = 5;
constexpr double kStepDeviation = 0.05;
constexpr double kConstantEpsilon = 1e-9;

} // namespace

TemporalValidator::TemporalValidator(const LivenessConfig& config) : config_(config) {
}

TemporalResult TemporalValidator::evaluate(const std::vector<TemporalSample>& samples) const {
    TemporalResult result;
    result.samples = samples.size();
    if (samples.size() < config_.temporal_min_samples) return result;

    std::vector<double> t, stim, resp;
    t.reserve(samples.size());
    stim.reserve(samples.size());
    resp.reserve(samples.size());
    for (const auto& s : samples) {
        t.push_back(s.timestamp_ms);
        stim.push_back(s.stimulus);
        resp.push_back(s.response);
    }

    const double fs = dsp::estimate_sample_rate(t);
    if (fs <= 0.0) return result;

    std::vector<double> x = dsp::resample_uniform(t, stim, fs);
    std::vector<double> y = dsp::resample_uniform(t, resp, fs);
    if (x.size() < kMinOverlapSamples) return result;

    // Nothing was displayed that could provoke a response
    if (dsp::stddev(x) <= kConstantEpsilon) return result;

    result.evaluated = true;
    result.step_delay_ms = step_delay(samples);

    if (dsp::stddev(y) <= kConstantEpsilon) {
        // Non-reactive source
        result.strength = 0.0;
        return result;
    }

    const size_t n = x.size();
    const size_t max_lag = static_cast<size_t>(std::floor(config_.xcorr_max_lag_ms * fs / 1000.0));

    double best = -2.0;
    size_t best_lag = 0;
    for (size_t lag = 0; lag <= max_lag && n - lag >= kMinOverlapSamples; ++lag) {
        // stimulus(t) against response(t + lag)
        const double r = dsp::pearson(x.data(), y.data() + lag, n - lag);
        if (r > best) {
            best = r;
            best_lag = lag;
        }
    }

    if (best <= 0.0) {
        result.strength = 0.0;
        return result;
    }

    const double delay = static_cast<double>(best_lag) * 1000.0 / fs;
    result.delay_ms = delay;
    result.strength = best;
    result.passed = delay >= config_.response_delay_min_ms &&
                    delay <= config_.response_delay_max_ms &&
                    best >= config_.xcorr_min_strength;

    if (ENABLE_DEBUG_LOGGING) {
        std::cout << "[Temporal] fs=" << fs << " lag=" << delay << "ms r=" << best
                  << (result.passed ? " PASS" : " FAIL") << std::endl;
    }
    return result;
}

std::optional<double> TemporalValidator::step_delay(const std::vector<TemporalSample>& samples) const {
    // Newest stimulus change first; stop at the first one that got a response
    for (size_t i = samples.size(); i-- > kStepBaselineSamples;) {
        if (samples[i].stimulus == samples[i - 1].stimulus) continue;

        double baseline = 0.0;
        for (size_t k = i - kStepBaselineSamples; k < i; ++k) baseline += samples[k].response;
        baseline /= static_cast<double>(kStepBaselineSamples);
        if (std::abs(baseline) <= kConstantEpsilon) continue;

        for (size_t j = i; j < samples.size(); ++j) {
            if (std::abs(samples[j].response - baseline) > kStepDeviation * std::abs(baseline)) {
                return samples[j].timestamp_ms - samples[i].timestamp_ms;
            }
        }
    }
    return std::nullopt;
}

} // namespace prism
