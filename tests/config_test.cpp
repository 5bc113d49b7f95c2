#include "LivenessConfig.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

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

template <typename Fn>
static bool throws_invalid(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "=== LivenessConfig Test ===" << std::endl;

    // Defaults are valid
    {
        LivenessConfig config;
        bool ok = true;
        try {
            config.validate();
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            ok = false;
        }
        assert_true(ok, "default config validates");
        assert_true(config.rppg_method == RppgMethod::POS, "POS is the default rPPG method");
    }

    // Strict preset is stricter and still valid
    {
        LivenessConfig def;
        LivenessConfig strict = LivenessConfig::strict();
        bool ok = true;
        try {
            strict.validate();
        } catch (const std::invalid_argument&) {
            ok = false;
        }
        assert_true(ok, "strict preset validates");
        assert_true(strict.decision_threshold > def.decision_threshold, "strict raises the decision threshold");
        assert_true(strict.flicker_hard_gate, "strict promotes flicker to a hard gate");
        assert_true(strict.xcorr_min_strength > def.xcorr_min_strength, "strict requires stronger xcorr");
    }

    // Invalid combinations are named
    {
        LivenessConfig c;
        c.min_bpm = 200.0;
        assert_true(throws_invalid([&] { c.validate(); }), "min_bpm above max_bpm rejected");

        LivenessConfig d;
        d.response_delay_max_ms = 800.0;
        bool named = false;
        try {
            d.validate();
        } catch (const std::invalid_argument& e) {
            named = std::string(e.what()).find("response_delay_max_ms") != std::string::npos;
        }
        assert_true(named, "error message names the offending option");

        LivenessConfig e;
        e.flicker_min_hz = 2.0;
        assert_true(throws_invalid([&] { e.validate(); }), "flicker cutoff inside the cardiac band rejected");

        LivenessConfig f;
        f.weights.chroma = -1.0;
        assert_true(throws_invalid([&] { f.validate(); }), "negative weight rejected");
    }

    // JSON: partial override keeps defaults, method parsed case-insensitively
    {
        nlohmann::json j = {
            {"rppg_method", "chrom"},
            {"decision_threshold", 55.0},
            {"weights", {{"chroma", 30.0}}}
        };
        LivenessConfig c = LivenessConfig::from_json(j);
        assert_true(c.rppg_method == RppgMethod::CHROM, "rppg_method parsed from JSON");
        assert_true(c.decision_threshold == 55.0, "scalar override applied");
        assert_true(c.weights.chroma == 30.0, "nested weight override applied");
        assert_true(c.weights.temporal == LivenessConfig().weights.temporal, "unspecified weights keep defaults");
        assert_true(c.min_bpm == LivenessConfig().min_bpm, "unspecified keys keep defaults");
    }

    // JSON errors
    {
        bool threw = false;
        try {
            LivenessConfig::from_json({{"rppg_method", "ICA"}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert_true(threw, "unknown rppg_method rejected");

        threw = false;
        try {
            LivenessConfig::from_json({{"min_bpm", "fast"}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert_true(threw, "wrong value type rejected");

        std::string message;
        try {
            LivenessConfig::from_json({{"rppg_buffer_capacity", -1}});
        } catch (const std::runtime_error& e) {
            message = e.what();
        }
        assert_true(message.find("rppg_buffer_capacity") != std::string::npos,
                    "negative buffer capacity rejected and named");

        threw = false;
        try {
            LivenessConfig::from_json({{"welch_nfft", -2048.0}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert_true(threw, "negative welch_nfft rejected");
    }

    // Oversized buffers are rejected before anything is allocated
    {
        LivenessConfig c;
        c.rppg_buffer_capacity = static_cast<size_t>(-1);
        assert_true(throws_invalid([&] { c.validate(); }), "wrapped rppg_buffer_capacity rejected");

        LivenessConfig d;
        d.temporal_buffer_capacity = 20000;
        assert_true(throws_invalid([&] { d.validate(); }), "temporal_buffer_capacity above 10000 rejected");

        LivenessConfig e;
        e.welch_nfft = 1u << 20;
        assert_true(throws_invalid([&] { e.validate(); }), "welch_nfft above 65536 rejected");

        LivenessConfig f;
        f.corneal_window_frames = 50000;
        assert_true(throws_invalid([&] { f.validate(); }), "corneal_window_frames above 10000 rejected");
    }

    // to_json / from_json preserve every value
    {
        LivenessConfig strict = LivenessConfig::strict();
        LivenessConfig copy = LivenessConfig::from_json(strict.to_json());
        assert_true(copy.to_json() == strict.to_json(), "to_json() output loads back unchanged");
    }

    // load_file
    {
        const std::string path = "prism_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"rppg_method": "GREEN", "warmup_min_frames": 45})";
        }
        LivenessConfig c = LivenessConfig::load_file(path);
        assert_true(c.rppg_method == RppgMethod::GREEN && c.warmup_min_frames == 45, "load_file() reads overrides");
        std::remove(path.c_str());

        bool threw = false;
        try {
            LivenessConfig::load_file("does_not_exist.json");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert_true(threw, "load_file() on a missing file throws");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
