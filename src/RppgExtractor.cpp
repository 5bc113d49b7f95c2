#include "RppgExtractor.hpp"
#include "SignalProcessing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>

// Debug logging flag - set to false for production to avoid hot-path logging
#define ENABLE_DEBUG_LOGGING false

namespace prism {

namespace {

constexpr double kMinRrMs = 333.0;    // 180 BPM
constexpr double kMaxRrMs = 1500.0;   // 40 BPM
constexpr double kPeakMinDistanceS = 0.4;
constexpr double kPeakProminenceSigma = 0.3;

double projection_alpha(const std::vector<double>& x, const std::vector<double>& y) {
    const double sy = dsp::stddev(y);
    if (sy <= 1e-12) return 0.0;
    return dsp::stddev(x) / sy;
}

// value / mean - 1, so channels share a scale regardless of skin tone
std::vector<double> normalize_channel(const std::vector<double>& c) {
    const double m = dsp::mean(c);
    std::vector<double> out(c.size(), 0.0);
    if (std::abs(m) <= 1e-9) return out;
    for (size_t i = 0; i < c.size(); ++i) out[i] = c[i] / m - 1.0;
    return out;
}

} // namespace

std::vector<double> GreenMethod::project(const std::vector<double>& /*r*/,
                                         const std::vector<double>& g,
                                         const std::vector<double>& /*b*/) const {
    return g;
}

std::vector<double> ChromMethod::project(const std::vector<double>& r,
                                         const std::vector<double>& g,
                                         const std::vector<double>& b) const {
    const size_t n = g.size();
    std::vector<double> x(n), y(n);
    for (size_t i = 0; i < n; ++i) {
        x[i] = 3.0 * r[i] - 2.0 * g[i];
        y[i] = 1.5 * r[i] + g[i] - 1.5 * b[i];
    }
    const double alpha = projection_alpha(x, y);
    std::vector<double> s(n);
    for (size_t i = 0; i < n; ++i) s[i] = x[i] - alpha * y[i];
    return s;
}

std::vector<double> PosMethod::project(const std::vector<double>& r,
                                       const std::vector<double>& g,
                                       const std::vector<double>& b) const {
    const size_t n = g.size();
    std::vector<double> x(n), y(n);
    for (size_t i = 0; i < n; ++i) {
        x[i] = g[i] - b[i];
        y[i] = -2.0 * r[i] + g[i] + b[i];
    }
    const double alpha = projection_alpha(x, y);
    std::vector<double> s(n);
    for (size_t i = 0; i < n; ++i) s[i] = x[i] + alpha * y[i];
    return s;
}

std::unique_ptr<RppgMethodStrategy> create_rppg_method(RppgMethod method) {
    switch (method) {
        case RppgMethod::GREEN: return std::make_unique<GreenMethod>();
        case RppgMethod::CHROM: return std::make_unique<ChromMethod>();
        case RppgMethod::POS:   return std::make_unique<PosMethod>();
    }
    return std::make_unique<PosMethod>();
}

RppgExtractor::RppgExtractor(const LivenessConfig& config)
    : config_(config), strategy_(create_rppg_method(config.rppg_method)) {
}

RppgResult RppgExtractor::extract(const std::vector<RgbSample>& samples) const {
    RppgResult result;
    result.samples = samples.size();

    if (samples.size() < config_.rppg_min_samples) return result;
    const double span_ms = samples.back().timestamp_ms - samples.front().timestamp_ms;
    if (span_ms < config_.rppg_min_window_ms) return result;

    std::vector<double> t, r, g, b;
    t.reserve(samples.size());
    r.reserve(samples.size());
    g.reserve(samples.size());
    b.reserve(samples.size());
    for (const auto& s : samples) {
        t.push_back(s.timestamp_ms);
        r.push_back(s.r);
        g.push_back(s.g);
        b.push_back(s.b);
    }

    const double fs = dsp::estimate_sample_rate(t);
    if (fs <= 2.0 * config_.cardiac_band_high_hz) {
        // Cannot resolve the cardiac band at this frame rate
        return result;
    }
    result.sample_rate_hz = fs;
    result.evaluated = true;

    std::vector<double> pulse = strategy_->project(
        normalize_channel(dsp::resample_uniform(t, r, fs)),
        normalize_channel(dsp::resample_uniform(t, g, fs)),
        normalize_channel(dsp::resample_uniform(t, b, fs)));

    dsp::detrend_linear(pulse);
    if (!dsp::zscore(pulse)) {
        // Flat waveform: no cardiac evidence at all
        result.signal_quality = 0.0;
        return result;
    }

    dsp::Spectrum psd = dsp::welch_psd(pulse, fs, config_.welch_segment_samples, config_.welch_nfft);
    const double total = dsp::sum_above(psd, 0.0);
    const double band = dsp::band_sum(psd, config_.cardiac_band_low_hz, config_.cardiac_band_high_hz);
    const double sqi = total > 0.0 ? std::clamp(band / total, 0.0, 1.0) : 0.0;
    result.signal_quality = sqi;

    auto peak_hz = dsp::peak_frequency(psd, config_.cardiac_band_low_hz, config_.cardiac_band_high_hz);
    if (peak_hz) {
        const double bpm = *peak_hz * 60.0;
        result.peak_bpm = bpm;
        if (sqi >= config_.min_signal_quality && bpm >= config_.min_bpm && bpm <= config_.max_bpm) {
            result.bpm = bpm;
        }
    }

    std::vector<double> filtered = dsp::bandpass_fft(
        pulse, fs, config_.cardiac_band_low_hz, config_.cardiac_band_high_hz);
    result.hrv = compute_hrv(filtered, fs);

    if (ENABLE_DEBUG_LOGGING) {
        std::cout << "[rPPG " << to_string(strategy_->method()) << "] fs=" << fs
                  << " sqi=" << sqi
                  << " peak=" << (result.peak_bpm ? *result.peak_bpm : 0.0)
                  << " beats=" << result.hrv.beats << std::endl;
    }
    return result;
}

HrvMetrics RppgExtractor::compute_hrv(const std::vector<double>& pulse, double fs_hz) const {
    HrvMetrics m;
    if (pulse.size() < 4 || fs_hz <= 0.0) return m;

    const size_t min_distance = std::max<size_t>(1, static_cast<size_t>(std::lround(kPeakMinDistanceS * fs_hz)));
    const double prominence = kPeakProminenceSigma * dsp::stddev(pulse);
    std::vector<double> peaks = dsp::find_peaks(pulse, min_distance, prominence);
    m.beats = peaks.size();
    if (peaks.size() < 3) return m;

    std::vector<double> rr;
    for (size_t i = 1; i < peaks.size(); ++i) {
        const double interval_ms = (peaks[i] - peaks[i - 1]) * 1000.0 / fs_hz;
        if (interval_ms >= kMinRrMs && interval_ms <= kMaxRrMs) rr.push_back(interval_ms);
    }
    m.intervals = rr.size();
    if (rr.size() < 2) return m;

    double sq = 0.0;
    for (size_t i = 1; i < rr.size(); ++i) {
        const double d = rr[i] - rr[i - 1];
        sq += d * d;
    }
    m.rmssd_ms = std::sqrt(sq / static_cast<double>(rr.size() - 1));
    m.sdnn_ms = dsp::stddev(rr);

    // Fixed-width histogram: a periodic source collapses into a single bin
    std::map<long, size_t> bins;
    for (double v : rr) {
        ++bins[static_cast<long>(std::floor(v / config_.hrv_bin_width_ms))];
    }
    const double n = static_cast<double>(rr.size());
    for (const auto& kv : bins) {
        const double p = static_cast<double>(kv.second) / n;
        m.entropy -= p * std::log(p);
    }
    m.score = std::clamp(m.entropy / std::log(n), 0.0, 1.0);
    m.biologically_valid = m.rmssd_ms >= config_.hrv_min_rmssd_ms &&
                           m.entropy >= config_.hrv_min_entropy;
    return m;
}

} // namespace prism
