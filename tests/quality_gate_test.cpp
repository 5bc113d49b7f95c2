#include "QualityGate.hpp"
#include <iostream>
#include <string>

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

static cv::Mat textured(int w, int h, uint64_t seed, double mean = 128.0, double sd = 20.0) {
    cv::Mat img(h, w, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(img, cv::RNG::NORMAL, mean, sd);
    return img;
}

int main() {
    std::cout << "=== QualityGate Test ===" << std::endl;

    LivenessConfig config;
    QualityGate gate(config);

    // Good ROI passes
    {
        cv::Mat roi = textured(48, 32, 1);
        QualityVerdict v = gate.evaluate(roi, cv::Mat());
        assert_true(v.passed && v.reason == QualityReason::PASS, "textured ROI passes");
        assert_true(v.features.motion_score == 0.0, "no motion without a previous ROI");
        assert_true(std::string(to_string(v.reason)) == "pass", "reason serializes as 'pass'");
    }

    // Too small
    {
        cv::Mat roi = textured(10, 10, 2);
        QualityVerdict v = gate.evaluate(roi, cv::Mat());
        assert_true(!v.passed && v.reason == QualityReason::ROI_TOO_SMALL, "tiny ROI rejected as roi_too_small");
    }

    // Blurry (flat)
    {
        cv::Mat roi(32, 48, CV_8UC1, cv::Scalar(128));
        QualityVerdict v = gate.evaluate(roi, cv::Mat());
        assert_true(!v.passed && v.reason == QualityReason::TOO_BLURRY, "flat ROI rejected as too_blurry");
    }

    // Exposure clipping: checked after blur, so the ROI needs texture
    {
        cv::Mat roi = textured(48, 32, 3, 250.0, 30.0);
        QualityVerdict v = gate.evaluate(roi, cv::Mat());
        assert_true(v.features.exposure_clip_fraction > config.max_exposure_clip_fraction,
                    "saturated ROI has a high clip fraction");
        assert_true(!v.passed && v.reason == QualityReason::BAD_EXPOSURE, "saturated ROI rejected as bad_exposure");
    }

    // Motion against the previous ROI
    {
        cv::Mat a = textured(48, 32, 4);
        cv::Mat b = textured(48, 32, 5, 128.0, 40.0);
        QualityVerdict v = gate.evaluate(b, a);
        assert_true(v.features.motion_score > config.max_motion_score, "unrelated ROIs give a high motion score");
        assert_true(!v.passed && v.reason == QualityReason::TOO_MUCH_MOTION, "large motion rejected");

        QualityVerdict same = gate.evaluate(a, a);
        assert_true(same.passed && same.features.motion_score == 0.0, "identical ROIs show no motion");

        cv::Mat resized = textured(40, 30, 6);
        QualityVerdict mismatch = gate.evaluate(a, resized);
        assert_true(mismatch.features.motion_score == 0.0, "size change skips the motion check");
    }

    // Disabled gate passes everything but still reports features
    {
        LivenessConfig off = config;
        off.enable_quality_gate = false;
        QualityGate disabled(off);
        cv::Mat roi(32, 48, CV_8UC1, cv::Scalar(128));
        QualityVerdict v = disabled.evaluate(roi, cv::Mat());
        assert_true(v.passed && v.reason == QualityReason::DISABLED, "disabled gate reports 'disabled'");
        assert_true(v.features.roi_min_dimension == 32, "features computed when disabled");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
