#include "LivenessConfig.hpp"
#include "LivenessSession.hpp"
#include "SyntheticSource.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

using namespace prism;

// 10 s synthetic subject at 78 BPM, run once per rPPG method
int main() {
    std::cout << "=== PRISM Synthetic Sanity Check ===" << std::endl;

    SyntheticParams params;
    params.pulse_bpm = 78.0;

    SyntheticSource source(params);
    const size_t frames = static_cast<size_t>(10.0 * params.fps);

    int failures = 0;
    for (RppgMethod method : {RppgMethod::GREEN, RppgMethod::CHROM, RppgMethod::POS}) {
        LivenessConfig config;
        config.rppg_method = method;

        LivenessSession session(config);
        for (size_t i = 0; i < frames; ++i) {
            session.submit_frame(source.frame(i));
        }

        const LivenessResult& r = session.last_result();
        const bool bpm_ok = r.bpm && std::abs(*r.bpm - params.pulse_bpm) <= 5.0;
        if (!bpm_ok || !r.is_human) ++failures;

        std::cout << std::left << std::setw(6) << to_string(method)
                  << " bpm=" << std::fixed << std::setprecision(1) << (r.bpm ? *r.bpm : 0.0)
                  << (r.bpm ? "" : " (absent)")
                  << " sqi=" << std::setprecision(3) << r.signal_quality
                  << " conf=" << std::setprecision(1) << r.confidence
                  << " state=" << to_string(session.state())
                  << " -> " << (r.is_human ? "✓ HUMAN" : "✗ NOT HUMAN")
                  << std::endl;
    }

    std::cout << (failures == 0 ? "✓ All methods agree" : "⚠️  Some methods disagree") << std::endl;
    return failures == 0 ? 0 : 1;
}
