#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace prism {
namespace dsp {

/**
 * @brief One-sided spectrum (power or amplitude) with its frequency axis
 */
struct Spectrum {
    std::vector<double> freqs;
    std::vector<double> values;

    bool empty() const { return values.empty(); }
};

double mean(const std::vector<double>& x);

/** Population standard deviation */
double stddev(const std::vector<double>& x);

/**
 * @brief Pearson correlation of two equally sized ranges
 * @return 0 when either range is constant
 */
double pearson(const double* a, const double* b, size_t n);

/**
 * @brief Sample rate (Hz) implied by a millisecond timestamp series
 * @return 0 when the series spans no time
 */
double estimate_sample_rate(const std::vector<double>& t_ms);

/**
 * @brief Linear resampling onto a uniform grid starting at t_ms.front()
 *
 * Repeated timestamps keep the latest value. Output length covers the
 * full input span at fs_hz.
 */
std::vector<double> resample_uniform(const std::vector<double>& t_ms,
                                     const std::vector<double>& values,
                                     double fs_hz);

/** Remove least-squares linear trend in place */
void detrend_linear(std::vector<double>& x);

/**
 * @brief Zero mean, unit variance in place
 * @return false if the signal is constant (left unchanged)
 */
bool zscore(std::vector<double>& x);

/**
 * @brief Zero-phase band-pass by masking the DFT outside [low_hz, high_hz]
 */
std::vector<double> bandpass_fft(const std::vector<double>& x, double fs_hz,
                                 double low_hz, double high_hz);

/**
 * @brief Welch power spectral density
 *
 * Hann window, 50% overlap, per-segment mean removal, zero-padded to nfft.
 */
Spectrum welch_psd(const std::vector<double>& x, double fs_hz,
                   size_t segment, size_t nfft);

/** One-sided DFT magnitude (rfft equivalent) */
Spectrum amplitude_spectrum(const std::vector<double>& x, double fs_hz);

/** Sum of spectrum values with low_hz <= f <= high_hz */
double band_sum(const Spectrum& s, double low_hz, double high_hz);

/** Sum of spectrum values with f > low_hz */
double sum_above(const Spectrum& s, double low_hz);

/**
 * @brief Dominant frequency inside [low_hz, high_hz], parabolic-interpolated
 */
std::optional<double> peak_frequency(const Spectrum& s, double low_hz, double high_hz);

/**
 * @brief Local maxima with minimum spacing and prominence
 * @return Sub-sample peak positions (ascending)
 */
std::vector<double> find_peaks(const std::vector<double>& x,
                               size_t min_distance,
                               double min_prominence);

/** Variance of the Laplacian of a single-channel image */
double laplacian_variance(const cv::Mat& gray);

} // namespace dsp
} // namespace prism
