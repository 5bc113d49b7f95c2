#pragma once

#include "LivenessConfig.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace prism {

/**
 * @brief Mean forehead color of one accepted frame (0-255 per channel)
 */
struct RgbSample {
    double timestamp_ms = 0.0;
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

/**
 * @brief Pulse extraction strategy
 *
 * Inputs are uniformly resampled channels already normalized to
 * (value / window mean - 1). Output is the raw 1-D pulse waveform.
 */
class RppgMethodStrategy {
public:
    virtual ~RppgMethodStrategy() = default;

    virtual RppgMethod method() const = 0;

    virtual std::vector<double> project(const std::vector<double>& r,
                                        const std::vector<double>& g,
                                        const std::vector<double>& b) const = 0;
};

class GreenMethod : public RppgMethodStrategy {
public:
    RppgMethod method() const override { return RppgMethod::GREEN; }
    std::vector<double> project(const std::vector<double>& r,
                                const std::vector<double>& g,
                                const std::vector<double>& b) const override;
};

// X = 3r - 2g, Y = 1.5r + g - 1.5b, S = X - (sX/sY) Y
class ChromMethod : public RppgMethodStrategy {
public:
    RppgMethod method() const override { return RppgMethod::CHROM; }
    std::vector<double> project(const std::vector<double>& r,
                                const std::vector<double>& g,
                                const std::vector<double>& b) const override;
};

// X = g - b, Y = -2r + g + b, S = X + (sX/sY) Y
class PosMethod : public RppgMethodStrategy {
public:
    RppgMethod method() const override { return RppgMethod::POS; }
    std::vector<double> project(const std::vector<double>& r,
                                const std::vector<double>& g,
                                const std::vector<double>& b) const override;
};

std::unique_ptr<RppgMethodStrategy> create_rppg_method(RppgMethod method);

/**
 * @brief Beat-to-beat variability of the band-passed pulse
 */
struct HrvMetrics {
    size_t beats = 0;
    size_t intervals = 0;
    double rmssd_ms = 0.0;
    double sdnn_ms = 0.0;
    double entropy = 0.0;   // Shannon entropy of the RR histogram (nats)
    double score = 0.0;     // Entropy normalized to 0-1
    bool biologically_valid = false;
};

struct RppgResult {
    bool evaluated = false;               // Enough samples to run spectral analysis
    std::optional<double> bpm;            // Only when SQI clears the configured minimum
    std::optional<double> signal_quality;
    std::optional<double> peak_bpm;       // Spectral peak regardless of SQI
    double sample_rate_hz = 0.0;
    size_t samples = 0;
    HrvMetrics hrv;

    bool is_valid() const { return bpm.has_value(); }
};

/**
 * @brief rPPG Extractor
 *
 * Pipeline: uniform resampling -> channel normalization -> method projection
 * -> linear detrend -> z-score -> Welch PSD (heart rate, SQI) and FFT
 * band-pass -> peak detection (HRV).
 */
class RppgExtractor {
public:
    explicit RppgExtractor(const LivenessConfig& config);

    RppgMethod method() const { return strategy_->method(); }

    /**
     * @brief Analyze the current RGB window
     * @param samples Time-ordered samples (oldest first)
     */
    RppgResult extract(const std::vector<RgbSample>& samples) const;

    /**
     * @brief HRV metrics from a band-passed pulse waveform
     */
    HrvMetrics compute_hrv(const std::vector<double>& pulse, double fs_hz) const;

private:
    LivenessConfig config_;
    std::unique_ptr<RppgMethodStrategy> strategy_;
};

} // namespace prism
