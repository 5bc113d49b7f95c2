#include "PhysicsProbes.hpp"
#include <cmath>
#include <iostream>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

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

// Textured BGR face; red channel carries the blue texture scaled by red_gain
static cv::Mat scattering_face(double red_gain) {
    cv::Mat tex(112, 96, CV_32F);
    cv::RNG rng(11);
    rng.fill(tex, cv::RNG::NORMAL, 0.0, 20.0);

    std::vector<cv::Mat> ch(3);
    tex.convertTo(ch[0], CV_8U, 1.0, 128.0);        // B
    tex.convertTo(ch[1], CV_8U, 1.0, 128.0);        // G
    tex.convertTo(ch[2], CV_8U, red_gain, 128.0);   // R
    cv::Mat face;
    cv::merge(ch, face);
    return face;
}

static EyeRegion tracked_eye(cv::Rect region, cv::Point2f pupil, cv::Point2f glint) {
    EyeRegion eye;
    eye.region = region;
    eye.pupil = pupil;
    eye.glint = glint;
    return eye;
}

int main() {
    std::cout << "=== PhysicsProbes Test ===" << std::endl;

    LivenessConfig config;
    PhysicsProbes probes(config);
    cv::Mat forehead(32, 48, CV_8UC3, cv::Scalar(110, 140, 170));

    // Chroma sync
    {
        cv::Mat red_face(112, 96, CV_8UC3, cv::Scalar(100, 110, 190));
        cv::Mat blue_face(112, 96, CV_8UC3, cv::Scalar(190, 110, 100));
        cv::Mat green_face(112, 96, CV_8UC3, cv::Scalar(100, 190, 110));

        assert_true(probes.check_chroma(red_face, StimulusColor::RED).passed, "red-lit face follows RED");
        assert_true(!probes.check_chroma(blue_face, StimulusColor::RED).passed, "blue face under RED fails");
        assert_true(probes.check_chroma(blue_face, StimulusColor::BLUE).passed, "blue-lit face follows BLUE");
        assert_true(probes.check_chroma(green_face, StimulusColor::GREEN).passed, "green-lit face follows GREEN");
        assert_true(!probes.check_chroma(red_face, StimulusColor::GREEN).passed, "red face under GREEN fails");
        assert_true(probes.check_chroma(red_face, StimulusColor::WHITE).passed, "WHITE always passes");
        assert_true(!probes.check_chroma(red_face, StimulusColor::NONE).passed, "no stimulus never passes");

        ChromaResult r = probes.check_chroma(red_face, StimulusColor::RED);
        assert_true(std::abs(r.face_mean_rgb[0] - 190.0) < 1e-9, "face mean reported in RGB order");
    }

    // Subsurface scattering
    {
        FrameBox soft_red(scattering_face(0.7), forehead, StimulusColor::WHITE, 0.0);
        SubsurfaceResult r = probes.probe_subsurface(soft_red);
        std::cout << "  sss ratio=" << r.ratio.value_or(-1) << std::endl;
        assert_true(r.evaluated && r.ratio, "subsurface evaluated under WHITE");
        assert_true(r.ratio && *r.ratio > 1.5 && *r.ratio < 3.0, "softer red channel raises the blue/red ratio");
        assert_true(r.passed, "blue/red ratio inside the scattering window passes");

        FrameBox opaque(scattering_face(1.0), forehead, StimulusColor::RED, 0.0);
        SubsurfaceResult flat_ratio = probes.probe_subsurface(opaque);
        assert_true(flat_ratio.ratio && std::abs(*flat_ratio.ratio - 1.0) < 0.01, "identical channels give ratio 1");
        assert_true(!flat_ratio.passed, "ratio 1 fails the scattering check");

        FrameBox green_lit(scattering_face(0.7), forehead, StimulusColor::GREEN, 0.0);
        assert_true(!probes.probe_subsurface(green_lit).evaluated, "GREEN stimulus skips the subsurface probe");

        cv::Mat uniform(112, 96, CV_8UC3, cv::Scalar(120, 130, 140));
        FrameBox flat(uniform, forehead, StimulusColor::WHITE, 0.0);
        SubsurfaceResult none = probes.probe_subsurface(flat);
        assert_true(none.evaluated && !none.ratio && !none.passed, "flat region gives no ratio");

        FrameBox custom = soft_red;
        custom.metadata.shadow_boundary = cv::Rect(10, 10, 20, 20);
        assert_true(PhysicsProbes::shadow_region(custom) == cv::Rect(10, 10, 20, 20),
                    "locator-provided shadow boundary is used");
    }

    // Eye localisation from the patch
    {
        cv::Mat face(112, 96, CV_8UC3, cv::Scalar(120, 120, 120));
        cv::circle(face, cv::Point(30, 40), 3, cv::Scalar(10, 10, 10), -1);
        cv::circle(face, cv::Point(34, 38), 1, cv::Scalar(255, 255, 255), -1);
        EyeRegion eye;
        eye.region = cv::Rect(20, 30, 24, 20);
        auto obs = probes.locate_eye(face, eye);
        assert_true(obs.has_value(), "eye located from the patch");
        assert_true(obs && std::abs(obs->pupil.x - 30) <= 2 && std::abs(obs->pupil.y - 40) <= 2,
                    "pupil at the darkest point");
        assert_true(obs && std::abs(obs->glint.x - 34) <= 2 && std::abs(obs->glint.y - 38) <= 2,
                    "glint at the brightest point");

        EyeRegion tiny;
        tiny.region = cv::Rect(0, 0, 2, 2);
        assert_true(!probes.locate_eye(face, tiny), "too small an eye patch is skipped");
    }

    // Corneal decoupling
    {
        std::vector<CornealSample> live, flat_copy, still;
        for (int k = 0; k < 15; ++k) {
            const float dx = 3.0f * std::sin(0.7f * k);
            const float dy = 2.0f * std::cos(0.5f * k);

            CornealSample s;
            s.timestamp_ms = k * 33.3;
            // Real cornea: pupil rotates, glint stays put
            s.left = EyeObservation{cv::Point2f(30 + dx, 40 + dy), cv::Point2f(34, 38)};
            s.right = EyeObservation{cv::Point2f(66 + dx, 40 + dy), cv::Point2f(70, 38)};
            live.push_back(s);

            // Flat reproduction: everything moves together
            CornealSample c;
            c.timestamp_ms = s.timestamp_ms;
            c.left = EyeObservation{cv::Point2f(30 + dx, 40 + dy), cv::Point2f(34 + dx, 38 + dy)};
            c.right = EyeObservation{cv::Point2f(66 + dx, 40 + dy), cv::Point2f(70 + dx, 38 + dy)};
            flat_copy.push_back(c);

            CornealSample n;
            n.timestamp_ms = s.timestamp_ms;
            n.left = EyeObservation{cv::Point2f(30, 40), cv::Point2f(34, 38)};
            still.push_back(n);
        }

        CornealResult r = probes.probe_corneal(live);
        assert_true(r.evaluated && r.passed, "fixed glint with moving pupil passes");
        assert_true(r.decoupling && *r.decoupling > 0.9, "fixed glint is fully decoupled");
        assert_true(r.symmetry_passed, "both glints agree");

        CornealResult c = probes.probe_corneal(flat_copy);
        assert_true(c.evaluated && !c.passed, "glint moving with the pupil fails");
        assert_true(c.decoupling && *c.decoupling < 0.1, "coupled motion has near-zero decoupling");

        CornealResult s = probes.probe_corneal(still);
        assert_true(!s.evaluated && !s.passed, "no eye motion is not evaluated");

        std::vector<CornealSample> few(live.begin(), live.begin() + 3);
        assert_true(!probes.probe_corneal(few).evaluated, "too few frames is not evaluated");
    }

    // Locator-provided points pass straight through
    {
        cv::Mat face(112, 96, CV_8UC3, cv::Scalar(120, 120, 120));
        auto obs = probes.locate_eye(face, tracked_eye(cv::Rect(20, 30, 24, 20), {31.5f, 41.0f}, {33.0f, 37.5f}));
        assert_true(obs && obs->pupil == cv::Point2f(31.5f, 41.0f) && obs->glint == cv::Point2f(33.0f, 37.5f),
                    "locator pupil and glint used as given");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
