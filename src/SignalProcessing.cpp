#include "SignalProcessing.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <opencv2/imgproc.hpp>

namespace prism {
namespace dsp {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Forward DFT of a zero-padded real row vector, complex output (1 x nfft, CV_64FC2)
cv::Mat forward_dft(const std::vector<double>& x, size_t nfft) {
    cv::Mat in(1, static_cast<int>(nfft), CV_64F, cv::Scalar(0));
    const size_t n = std::min(x.size(), nfft);
    for (size_t i = 0; i < n; ++i) {
        in.at<double>(0, static_cast<int>(i)) = x[i];
    }
    cv::Mat spec;
    cv::dft(in, spec, cv::DFT_COMPLEX_OUTPUT);
    return spec;
}

double bin_frequency(size_t k, size_t n, double fs_hz) {
    // Folded: bins above n/2 mirror negative frequencies
    size_t folded = (k <= n / 2) ? k : n - k;
    return static_cast<double>(folded) * fs_hz / static_cast<double>(n);
}

} // namespace

double mean(const std::vector<double>& x) {
    if (x.empty()) return 0.0;
    return std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
}

double stddev(const std::vector<double>& x) {
    if (x.size() < 2) return 0.0;
    const double m = mean(x);
    double acc = 0.0;
    for (double v : x) acc += (v - m) * (v - m);
    return std::sqrt(acc / static_cast<double>(x.size()));
}

double pearson(const double* a, const double* b, size_t n) {
    if (n < 2) return 0.0;
    double ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);

    double sab = 0.0, saa = 0.0, sbb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double da = a[i] - ma;
        const double db = b[i] - mb;
        sab += da * db;
        saa += da * da;
        sbb += db * db;
    }
    if (saa <= 1e-12 || sbb <= 1e-12) return 0.0;
    return sab / std::sqrt(saa * sbb);
}

double estimate_sample_rate(const std::vector<double>& t_ms) {
    if (t_ms.size() < 2) return 0.0;
    const double span_ms = t_ms.back() - t_ms.front();
    if (!std::isfinite(span_ms) || span_ms <= 0.0) return 0.0;

    size_t distinct = 1;
    for (size_t i = 1; i < t_ms.size(); ++i) {
        if (t_ms[i] > t_ms[i - 1]) ++distinct;
    }
    return static_cast<double>(distinct - 1) * 1000.0 / span_ms;
}

std::vector<double> resample_uniform(const std::vector<double>& t_ms,
                                     const std::vector<double>& values,
                                     double fs_hz) {
    std::vector<double> out;
    if (t_ms.size() != values.size() || t_ms.size() < 2 || !std::isfinite(fs_hz) || fs_hz <= 0.0) {
        return out;
    }

    // Collapse repeated timestamps (latest value wins)
    std::vector<double> t;
    std::vector<double> v;
    t.reserve(t_ms.size());
    v.reserve(values.size());
    for (size_t i = 0; i < t_ms.size(); ++i) {
        if (!t.empty() && t_ms[i] <= t.back()) {
            v.back() = values[i];
            continue;
        }
        t.push_back(t_ms[i]);
        v.push_back(values[i]);
    }
    if (t.size() < 2) return out;

    const double step_ms = 1000.0 / fs_hz;
    const double span_ms = t.back() - t.front();
    if (!std::isfinite(span_ms)) return out;
    const size_t count = static_cast<size_t>(std::floor(span_ms / step_ms + 1e-6)) + 1;
    out.reserve(count);

    size_t j = 0;
    for (size_t k = 0; k < count; ++k) {
        const double tk = t.front() + static_cast<double>(k) * step_ms;
        while (j + 2 < t.size() && t[j + 1] < tk) ++j;
        const double t0 = t[j];
        const double t1 = t[j + 1];
        double w = (tk - t0) / (t1 - t0);
        w = std::clamp(w, 0.0, 1.0);
        out.push_back(v[j] + w * (v[j + 1] - v[j]));
    }
    return out;
}

void detrend_linear(std::vector<double>& x) {
    const size_t n = x.size();
    if (n < 2) {
        if (n == 1) x[0] = 0.0;
        return;
    }
    const double xm = static_cast<double>(n - 1) / 2.0;
    const double ym = mean(x);
    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - xm;
        sxy += dx * (x[i] - ym);
        sxx += dx * dx;
    }
    const double slope = sxx > 0.0 ? sxy / sxx : 0.0;
    for (size_t i = 0; i < n; ++i) {
        x[i] -= ym + slope * (static_cast<double>(i) - xm);
    }
}

bool zscore(std::vector<double>& x) {
    const double sd = stddev(x);
    if (sd <= 1e-12) return false;
    const double m = mean(x);
    for (double& v : x) v = (v - m) / sd;
    return true;
}

std::vector<double> bandpass_fft(const std::vector<double>& x, double fs_hz,
                                 double low_hz, double high_hz) {
    const size_t n = x.size();
    if (n < 4 || fs_hz <= 0.0) return x;

    cv::Mat spec = forward_dft(x, n);
    for (size_t k = 0; k < n; ++k) {
        const double f = bin_frequency(k, n, fs_hz);
        if (f < low_hz || f > high_hz) {
            spec.at<cv::Vec2d>(0, static_cast<int>(k)) = cv::Vec2d(0.0, 0.0);
        }
    }

    cv::Mat inv;
    cv::dft(spec, inv, cv::DFT_INVERSE | cv::DFT_SCALE);

    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = inv.at<cv::Vec2d>(0, static_cast<int>(i))[0];
    }
    return out;
}

Spectrum welch_psd(const std::vector<double>& x, double fs_hz,
                   size_t segment, size_t nfft) {
    Spectrum s;
    if (x.size() < 4 || fs_hz <= 0.0 || segment < 4) return s;

    segment = std::min(segment, x.size());
    nfft = std::max(nfft, segment);
    const size_t step = std::max<size_t>(1, segment / 2);
    const size_t segments = (x.size() - segment) / step + 1;

    std::vector<double> window(segment);
    double window_power = 0.0;
    for (size_t i = 0; i < segment; ++i) {
        window[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) /
                                         static_cast<double>(segment - 1));
        window_power += window[i] * window[i];
    }

    const size_t bins = nfft / 2 + 1;
    s.freqs.resize(bins);
    s.values.assign(bins, 0.0);
    for (size_t k = 0; k < bins; ++k) {
        s.freqs[k] = static_cast<double>(k) * fs_hz / static_cast<double>(nfft);
    }

    std::vector<double> buf(segment);
    for (size_t seg = 0; seg < segments; ++seg) {
        const size_t start = seg * step;
        double m = 0.0;
        for (size_t i = 0; i < segment; ++i) m += x[start + i];
        m /= static_cast<double>(segment);
        for (size_t i = 0; i < segment; ++i) {
            buf[i] = (x[start + i] - m) * window[i];
        }

        cv::Mat spec = forward_dft(buf, nfft);
        for (size_t k = 0; k < bins; ++k) {
            const cv::Vec2d c = spec.at<cv::Vec2d>(0, static_cast<int>(k));
            double p = (c[0] * c[0] + c[1] * c[1]) / (fs_hz * window_power);
            if (k != 0 && !(nfft % 2 == 0 && k == bins - 1)) p *= 2.0;
            s.values[k] += p;
        }
    }

    for (double& v : s.values) v /= static_cast<double>(segments);
    return s;
}

Spectrum amplitude_spectrum(const std::vector<double>& x, double fs_hz) {
    Spectrum s;
    if (x.size() < 2 || fs_hz <= 0.0) return s;

    const size_t n = x.size();
    cv::Mat spec = forward_dft(x, n);
    const size_t bins = n / 2 + 1;
    s.freqs.resize(bins);
    s.values.resize(bins);
    for (size_t k = 0; k < bins; ++k) {
        const cv::Vec2d c = spec.at<cv::Vec2d>(0, static_cast<int>(k));
        s.freqs[k] = static_cast<double>(k) * fs_hz / static_cast<double>(n);
        s.values[k] = std::sqrt(c[0] * c[0] + c[1] * c[1]);
    }
    return s;
}

double band_sum(const Spectrum& s, double low_hz, double high_hz) {
    double acc = 0.0;
    for (size_t k = 0; k < s.values.size(); ++k) {
        if (s.freqs[k] >= low_hz && s.freqs[k] <= high_hz) acc += s.values[k];
    }
    return acc;
}

double sum_above(const Spectrum& s, double low_hz) {
    double acc = 0.0;
    for (size_t k = 0; k < s.values.size(); ++k) {
        if (s.freqs[k] > low_hz) acc += s.values[k];
    }
    return acc;
}

std::optional<double> peak_frequency(const Spectrum& s, double low_hz, double high_hz) {
    if (s.values.size() < 3) return std::nullopt;

    size_t best = 0;
    double best_value = -1.0;
    for (size_t k = 0; k < s.values.size(); ++k) {
        if (s.freqs[k] < low_hz || s.freqs[k] > high_hz) continue;
        if (s.values[k] > best_value) {
            best_value = s.values[k];
            best = k;
        }
    }
    if (best_value <= 0.0) return std::nullopt;

    double f = s.freqs[best];
    if (best > 0 && best + 1 < s.values.size()) {
        const double a = s.values[best - 1];
        const double b = s.values[best];
        const double c = s.values[best + 1];
        const double denom = a - 2.0 * b + c;
        if (std::abs(denom) > 1e-18) {
            const double delta = std::clamp(0.5 * (a - c) / denom, -0.5, 0.5);
            f += delta * (s.freqs[1] - s.freqs[0]);
        }
    }
    return f;
}

std::vector<double> find_peaks(const std::vector<double>& x,
                               size_t min_distance,
                               double min_prominence) {
    const size_t n = x.size();
    std::vector<size_t> candidates;
    for (size_t i = 1; i + 1 < n; ++i) {
        if (!(x[i] > x[i - 1] && x[i] >= x[i + 1])) continue;

        // Prominence: height above the higher of the two surrounding minima
        double left_min = x[i];
        for (size_t j = i; j-- > 0;) {
            if (x[j] > x[i]) break;
            left_min = std::min(left_min, x[j]);
        }
        double right_min = x[i];
        for (size_t j = i + 1; j < n; ++j) {
            if (x[j] > x[i]) break;
            right_min = std::min(right_min, x[j]);
        }
        if (x[i] - std::max(left_min, right_min) >= min_prominence) {
            candidates.push_back(i);
        }
    }

    // Tallest first, suppress neighbours closer than min_distance
    std::vector<size_t> order = candidates;
    std::sort(order.begin(), order.end(),
              [&x](size_t a, size_t b) { return x[a] > x[b]; });
    std::vector<size_t> kept;
    for (size_t idx : order) {
        bool clear = true;
        for (size_t k : kept) {
            const size_t d = idx > k ? idx - k : k - idx;
            if (d < min_distance) {
                clear = false;
                break;
            }
        }
        if (clear) kept.push_back(idx);
    }
    std::sort(kept.begin(), kept.end());

    std::vector<double> peaks;
    peaks.reserve(kept.size());
    for (size_t i : kept) {
        const double a = x[i - 1];
        const double b = x[i];
        const double c = x[i + 1];
        const double denom = a - 2.0 * b + c;
        double offset = 0.0;
        if (std::abs(denom) > 1e-18) {
            offset = std::clamp(0.5 * (a - c) / denom, -0.5, 0.5);
        }
        peaks.push_back(static_cast<double>(i) + offset);
    }
    return peaks;
}

double laplacian_variance(const cv::Mat& gray) {
    if (gray.empty()) return 0.0;
    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);
    cv::Scalar m, sd;
    cv::meanStdDev(lap, m, sd);
    return sd[0] * sd[0];
}

} // namespace dsp
} // namespace prism
