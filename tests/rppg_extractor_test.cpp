#include "RppgExtractor.hpp"
#include <cmath>
#include <iostream>
#include <vector>

#include <opencv2/core.hpp>

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

static const double kPi = 3.14159265358979323846;

// Forehead colour with a green-channel pulse and mild sensor noise
static std::vector<RgbSample> pulse_series(double bpm, double fps, size_t n, double noise_sd = 0.3) {
    cv::RNG rng(7);
    std::vector<RgbSample> out;
    for (size_t i = 0; i < n; ++i) {
        const double t = i * 1000.0 / fps;
        const double pulse = 2.0 * std::sin(2.0 * kPi * (bpm / 60.0) * t / 1000.0);
        out.push_back({t,
                       170.0 + rng.gaussian(noise_sd),
                       140.0 + pulse + rng.gaussian(noise_sd),
                       110.0 + rng.gaussian(noise_sd)});
    }
    return out;
}

// Cosine beats with the given RR sequence (ms), repeated to fill n samples
static std::vector<double> beat_train(const std::vector<double>& rr_ms, double fs, size_t n) {
    std::vector<double> x(n);
    double beat_start = 0.0;
    size_t k = 0;
    for (size_t i = 0; i < n; ++i) {
        const double t = i * 1000.0 / fs;
        while (t >= beat_start + rr_ms[k % rr_ms.size()]) {
            beat_start += rr_ms[k % rr_ms.size()];
            ++k;
        }
        const double phase = (t - beat_start) / rr_ms[k % rr_ms.size()];
        x[i] = std::cos(2.0 * kPi * phase);
    }
    return x;
}

int main() {
    std::cout << "=== RppgExtractor Test ===" << std::endl;

    // Heart rate recovered by every method
    for (RppgMethod method : {RppgMethod::GREEN, RppgMethod::CHROM, RppgMethod::POS}) {
        LivenessConfig config;
        config.rppg_method = method;
        RppgExtractor extractor(config);
        assert_true(extractor.method() == method, "extractor uses the configured method");

        RppgResult r = extractor.extract(pulse_series(75.0, 30.0, 300));
        std::cout << "  " << to_string(method) << " bpm=" << (r.bpm ? *r.bpm : 0.0)
                  << " sqi=" << r.signal_quality.value_or(0.0) << std::endl;
        assert_true(r.evaluated, "10 s at 30 fps is evaluated");
        assert_true(std::abs(r.sample_rate_hz - 30.0) < 0.1, "sample rate estimated from timestamps");
        assert_true(r.bpm && std::abs(*r.bpm - 75.0) <= 5.0, "75 BPM pulse recovered within 5 BPM");
        assert_true(r.signal_quality && *r.signal_quality >= config.min_signal_quality,
                    "clean pulse clears the SQI minimum");
    }

    LivenessConfig config;
    RppgExtractor extractor(config);

    // Constant colour: no pulse, zero quality
    {
        std::vector<RgbSample> flat;
        for (size_t i = 0; i < 300; ++i) flat.push_back({i * 1000.0 / 30.0, 170.0, 140.0, 110.0});
        RppgResult r = extractor.extract(flat);
        assert_true(!r.bpm, "constant input reports no BPM");
        assert_true(r.signal_quality.value_or(0.0) < 0.3, "constant input has SQI below 0.3");
        assert_true(!r.is_valid(), "constant input is not a valid reading");
    }

    // Not enough data
    {
        RppgResult r = extractor.extract(pulse_series(75.0, 30.0, 60));
        assert_true(!r.evaluated && !r.bpm && !r.signal_quality, "fewer than rppg_min_samples is not evaluated");

        RppgResult slow = extractor.extract(pulse_series(75.0, 5.0, 120));
        assert_true(!slow.evaluated, "frame rate below twice the band edge is not evaluated");
    }

    // Irregular timestamps still resolve the rate
    {
        auto series = pulse_series(90.0, 30.0, 300);
        for (size_t i = 0; i < series.size(); i += 7) series[i].timestamp_ms += 4.0;
        RppgResult r = extractor.extract(series);
        assert_true(r.bpm && std::abs(*r.bpm - 90.0) <= 5.0, "jittered timestamps still give 90 BPM");
    }

    // HRV: a metronome has no variability, real RR sequences do
    {
        const double fs = 30.0;
        HrvMetrics periodic = extractor.compute_hrv(beat_train({800.0}, fs, 600), fs);
        assert_true(periodic.intervals >= 10, "periodic train yields RR intervals");
        assert_true(periodic.rmssd_ms < 1.0, "periodic train has near-zero RMSSD");
        assert_true(periodic.score < 0.5, "periodic train scores low");
        assert_true(!periodic.biologically_valid, "periodic train is not biologically valid");

        HrvMetrics irregular = extractor.compute_hrv(
            beat_train({700.0, 850.0, 760.0, 900.0, 720.0, 880.0, 780.0, 820.0}, fs, 600), fs);
        assert_true(irregular.intervals >= 10, "irregular train yields RR intervals");
        assert_true(irregular.rmssd_ms > config.hrv_min_rmssd_ms, "irregular train has measurable RMSSD");
        assert_true(irregular.score > periodic.score, "irregular train scores above the periodic one");
        assert_true(irregular.biologically_valid, "irregular train is biologically valid");
    }

    // Factory
    {
        auto pos = create_rppg_method(RppgMethod::POS);
        std::vector<double> r = {0.0, 0.0, 0.0, 0.0};
        std::vector<double> g = {0.01, -0.01, 0.02, -0.02};
        std::vector<double> b = {0.0, 0.0, 0.0, 0.0};
        auto s = pos->project(r, g, b);
        assert_true(pos->method() == RppgMethod::POS && s.size() == 4, "factory builds the POS projection");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
