#include "SpoofDetector.hpp"
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

static cv::Mat textured_gray(int w, int h, uint64_t seed) {
    cv::Mat img(h, w, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(img, cv::RNG::NORMAL, 128.0, 20.0);
    return img;
}

// Brightness series: base + pulse at pulse_hz + optional tone at flicker_hz
static std::vector<GreenSample> green_series(size_t n, double fps, double base,
                                             double pulse_amp, double pulse_hz,
                                             double flicker_amp = 0.0, double flicker_hz = 0.0) {
    std::vector<GreenSample> out;
    for (size_t i = 0; i < n; ++i) {
        const double t = i / fps;
        double v = base + pulse_amp * std::sin(2.0 * kPi * pulse_hz * t);
        if (flicker_amp > 0.0) v += flicker_amp * std::sin(2.0 * kPi * flicker_hz * t);
        out.push_back({t * 1000.0, v});
    }
    return out;
}

int main() {
    std::cout << "=== SpoofDetector Test ===" << std::endl;

    LivenessConfig config;
    SpoofDetector detector(config);

    // Texture
    {
        cv::Mat flat(112, 96, CV_8UC1, cv::Scalar(140));
        TextureResult screen = detector.check_texture(flat);
        assert_true(screen.local_std < 1e-3, "flat face has no local variation");
        assert_true(screen.detected && screen.uniformity > config.texture_uniformity_threshold,
                    "flat face flagged as screen texture");

        TextureResult skin = detector.check_texture(textured_gray(96, 112, 1));
        assert_true(!skin.detected, "textured face passes the texture check");
        assert_true(skin.uniformity < screen.uniformity, "texture lowers uniformity");
    }

    // Flicker
    {
        FlickerResult clean = detector.check_flicker(green_series(60, 30.0, 140.0, 2.0, 1.5));
        assert_true(clean.evaluated && !clean.detected, "cardiac-band brightness is not flicker");

        FlickerResult screen = detector.check_flicker(green_series(60, 30.0, 140.0, 0.5, 1.5, 4.0, 10.0));
        assert_true(screen.evaluated && screen.detected, "10 Hz brightness tone detected as flicker");
        assert_true(screen.ratio > clean.ratio, "flicker ratio grows with high-frequency energy");

        FlickerResult short_series = detector.check_flicker(green_series(30, 30.0, 140.0, 2.0, 1.5));
        assert_true(!short_series.evaluated, "flicker needs flicker_window_samples");

        FlickerResult slow = detector.check_flicker(green_series(60, 8.0, 140.0, 2.0, 1.5));
        assert_true(!slow.evaluated, "frame rate too low to see flicker is not evaluated");
    }

    // Moire
    {
        // Exact 4-pixel vertical grating plus a single impulse for a flat floor
        cv::Mat grating(112, 96, CV_8UC1);
        const uchar levels[4] = {128, 228, 128, 28};
        for (int y = 0; y < grating.rows; ++y) {
            for (int x = 0; x < grating.cols; ++x) {
                grating.at<uchar>(y, x) = levels[x % 4];
            }
        }
        grating.at<uchar>(5, 7) += 1;

        MoireResult screen = detector.check_moire(grating);
        std::cout << "  grating moire score=" << screen.score << std::endl;
        assert_true(screen.evaluated && screen.detected, "pixel grating detected as moire");

        MoireResult skin = detector.check_moire(textured_gray(96, 112, 2));
        assert_true(skin.evaluated && !skin.detected, "random texture has no moire");
        assert_true(screen.score > skin.score, "grating scores above texture");

        MoireResult empty = detector.check_moire(cv::Mat());
        assert_true(!empty.evaluated, "empty face is not evaluated");
    }

    // Static image / lighting
    {
        VarianceResult photo = detector.check_variance(green_series(90, 30.0, 140.0, 0.0, 1.0));
        assert_true(photo.evaluated && photo.is_static, "constant brightness is static");

        VarianceResult live = detector.check_variance(green_series(90, 30.0, 140.0, 2.0, 1.2));
        assert_true(live.evaluated && !live.is_static && !live.lighting_unstable, "pulse-level variation is alive");

        VarianceResult unstable = detector.check_variance(green_series(90, 30.0, 140.0, 60.0, 1.0));
        assert_true(unstable.lighting_unstable, "large swings flag unstable lighting");

        VarianceResult early = detector.check_variance(green_series(30, 30.0, 140.0, 0.0, 1.0));
        assert_true(!early.evaluated && !early.is_static, "variance needs static_min_samples");
    }

    // Geometry
    {
        cv::Mat face(112, 96, CV_8UC3, cv::Scalar(120, 130, 140));
        cv::Mat forehead(32, 48, CV_8UC3, cv::Scalar(110, 140, 170));

        FrameBox ok(face, forehead, StimulusColor::WHITE, 0.0);
        ok.metadata.face_box = cv::Rect(100, 50, 96, 112);
        ok.metadata.forehead_box = cv::Rect(124, 60, 48, 32);
        ok.metadata.left_eye = EyeRegion{cv::Rect(20, 35, 20, 12), std::nullopt, std::nullopt};
        ok.metadata.right_eye = EyeRegion{cv::Rect(56, 35, 20, 12), std::nullopt, std::nullopt};
        GeometryResult g = detector.check_geometry(ok);
        assert_true(g.valid && g.detail.empty(), "consistent metadata is valid");

        FrameBox no_meta(face, forehead, StimulusColor::NONE, 0.0);
        assert_true(detector.check_geometry(no_meta).valid, "frame without metadata is valid");

        FrameBox empty_box = ok;
        empty_box.metadata.face_box = cv::Rect(0, 0, 0, 112);
        assert_true(detector.check_geometry(empty_box).detail == "empty_face_box", "empty face box rejected");

        FrameBox outside = ok;
        outside.metadata.forehead_box = cv::Rect(10, 10, 48, 32);
        assert_true(detector.check_geometry(outside).detail == "forehead_outside_face", "forehead outside face rejected");

        FrameBox wide = ok;
        wide.metadata.face_box = cv::Rect(0, 0, 400, 60);
        wide.metadata.forehead_box.reset();
        assert_true(detector.check_geometry(wide).detail == "face_aspect_ratio", "impossible aspect ratio rejected");

        FrameBox stray_eye = ok;
        stray_eye.metadata.left_eye = EyeRegion{cv::Rect(90, 35, 20, 12), std::nullopt, std::nullopt};
        assert_true(detector.check_geometry(stray_eye).detail == "left_eye_outside_face", "eye outside face rejected");

        FrameBox stray_shadow = ok;
        stray_shadow.metadata.shadow_boundary = cv::Rect(-5, 40, 30, 30);
        assert_true(detector.check_geometry(stray_shadow).detail == "shadow_boundary_outside_face",
                    "shadow boundary outside face rejected");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
