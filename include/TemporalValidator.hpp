#pragma once

#include "LivenessConfig.hpp"

#include <optional>
#include <vector>

namespace prism {

/**
 * @brief Displayed stimulus scalar and observed face response at one instant
 */
struct TemporalSample {
    double timestamp_ms = 0.0;
    double stimulus = 0.0;   // Projected intensity of the displayed color (0-1)
    double response = 0.0;   // Mean face gray level (0-255)
};

struct TemporalResult {
    bool evaluated = false;
    std::optional<double> delay_ms;       // Best xcorr lag
    std::optional<double> strength;       // Correlation at the best lag
    std::optional<double> step_delay_ms;  // Last stimulus step to first response deviation
    bool passed = false;
    size_t samples = 0;
};

/**
 * @brief Temporal Response Validator
 *
 * Normalized cross-correlation of stimulus against response over lags
 * 0..xcorr_max_lag_ms. Passes when the best lag falls inside the
 * biological response window and the correlation is strong enough.
 * Zero lag means the "face" changed with the screen, not after it.
 */
class TemporalValidator {
public:
    explicit TemporalValidator(const LivenessConfig& config);

    TemporalResult evaluate(const std::vector<TemporalSample>& samples) const;

    /**
     * @brief Step-response delay on the raw (non-resampled) series
     */
    std::optional<double> step_delay(const std::vector<TemporalSample>& samples) const;

private:
    LivenessConfig config_;
};

} // namespace prism
