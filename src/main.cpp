#include "CryptoUtils.hpp"
#include "FrameBox.hpp"
#include "LivenessConfig.hpp"
#include "LivenessSession.hpp"
#include "Utils.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include <opencv2/videoio.hpp>

using namespace prism;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int /*signum*/) {
    g_running.store(false);
}

struct EvalOptions {
    std::string video;
    std::string config_path;
    std::string out_path;
    std::string method;
    double fps = 0.0;               // 0 = take it from the container
    bool cycle_stimulus = true;
    double hold_seconds = 1.0;
    double max_seconds = 0.0;       // 0 = whole video
    bool strict = false;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --video <path> [options]\n"
              << "  --config <json>        Liveness config file\n"
              << "  --strict               Start from the production-strict preset\n"
              << "  --method <name>        rPPG method override (GREEN|CHROM|POS)\n"
              << "  --fps <n>              Frame rate when the container has none\n"
              << "  --stimulus cycle|none  Stimulus schedule (default: cycle)\n"
              << "  --hold-seconds <s>     Time per stimulus color (default: 1.0)\n"
              << "  --max-seconds <s>      Stop after this much video\n"
              << "  --out <csv>            Per-frame results (default: prism_eval_<time>.csv)\n";
}

bool parse_args(int argc, char** argv, EvalOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string("Missing value for ") + name);
            }
            return argv[++i];
        };

        if (arg == "--video") {
            opts.video = next("--video");
        } else if (arg == "--config") {
            opts.config_path = next("--config");
        } else if (arg == "--out") {
            opts.out_path = next("--out");
        } else if (arg == "--method") {
            opts.method = next("--method");
        } else if (arg == "--fps") {
            opts.fps = std::stod(next("--fps"));
        } else if (arg == "--hold-seconds") {
            opts.hold_seconds = std::stod(next("--hold-seconds"));
        } else if (arg == "--max-seconds") {
            opts.max_seconds = std::stod(next("--max-seconds"));
        } else if (arg == "--stimulus") {
            const std::string mode = next("--stimulus");
            if (mode != "cycle" && mode != "none") {
                throw std::invalid_argument("--stimulus must be cycle or none");
            }
            opts.cycle_stimulus = (mode == "cycle");
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    if (opts.video.empty()) {
        throw std::invalid_argument("--video is required");
    }
    if (opts.hold_seconds <= 0.0) {
        throw std::invalid_argument("--hold-seconds must be positive");
    }
    return true;
}

StimulusColor scheduled_stimulus(double timestamp_ms, const EvalOptions& opts) {
    static const StimulusColor kCycle[] = {
        StimulusColor::RED, StimulusColor::BLUE, StimulusColor::GREEN, StimulusColor::WHITE
    };
    if (!opts.cycle_stimulus) return StimulusColor::NONE;
    const auto slot = static_cast<long>(timestamp_ms / (opts.hold_seconds * 1000.0));
    return kCycle[slot % 4];
}

LivenessConfig build_config(const EvalOptions& opts) {
    LivenessConfig config = opts.strict ? LivenessConfig::strict() : LivenessConfig();
    if (!opts.config_path.empty()) {
        std::ifstream in(opts.config_path);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + opts.config_path);
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config JSON: " + std::string(e.what()));
        }
        // File values override the selected preset
        nlohmann::json merged = config.to_json();
        merged.merge_patch(j);
        config = LivenessConfig::from_json(merged);
    }
    if (!opts.method.empty()) {
        auto method = parse_rppg_method(opts.method);
        if (!method) {
            throw std::invalid_argument("Unknown rPPG method: " + opts.method);
        }
        config.rppg_method = *method;
    }
    config.validate();
    return config;
}

std::string csv_value(const nlohmann::json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

void write_csv_header(std::ostream& csv, const nlohmann::json& details) {
    csv << "frame,timestamp_ms,stimulus,status,is_human,confidence,bpm,signal_quality,hrv_score";
    for (auto it = details.begin(); it != details.end(); ++it) {
        if (it.key() == "scores") continue;
        csv << "," << it.key();
    }
    csv << "\n";
}

void write_csv_row(std::ostream& csv, uint64_t frame_index, const FrameBox& frame,
                   const SubmitOutcome& outcome) {
    const nlohmann::json j = outcome.result.to_json();
    csv << frame_index << "," << std::fixed << std::setprecision(1) << frame.timestamp_ms
        << "," << to_string(frame.stimulus)
        << "," << to_string(outcome.status)
        << "," << (outcome.result.is_human ? 1 : 0)
        << "," << std::setprecision(2) << outcome.result.confidence
        << "," << csv_value(j["bpm"])
        << "," << std::setprecision(4) << outcome.result.signal_quality
        << "," << outcome.result.hrv_score;
    const nlohmann::json& details = j["details"];
    for (auto it = details.begin(); it != details.end(); ++it) {
        if (it.key() == "scores") continue;
        csv << "," << csv_value(it.value());
    }
    csv << "\n";
}

} // namespace

int main(int argc, char** argv) {
    signal(SIGINT, signal_handler);

    EvalOptions opts;
    LivenessConfig config;
    try {
        if (!parse_args(argc, argv, opts)) {
            print_usage(argv[0]);
            return 0;
        }
        config = build_config(opts);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    cv::VideoCapture capture(opts.video);
    if (!capture.isOpened()) {
        std::cerr << "❌ Cannot open video: " << opts.video << std::endl;
        return 1;
    }

    double fps = opts.fps;
    if (fps <= 0.0) fps = capture.get(cv::CAP_PROP_FPS);
    if (fps <= 0.0 || fps > 1000.0) {
        std::cerr << "⚠️  Video reports no frame rate, assuming 30 fps (use --fps)" << std::endl;
        fps = 30.0;
    }

    if (opts.out_path.empty()) {
        opts.out_path = "prism_eval_" + utils::get_timestamp_string() + ".csv";
    }
    if (!utils::ensure_directory_exists(utils::parent_directory(opts.out_path))) {
        std::cerr << "❌ Cannot create output directory for " << opts.out_path << std::endl;
        return 1;
    }
    std::ofstream csv(opts.out_path);
    if (!csv) {
        std::cerr << "❌ Cannot write " << opts.out_path << std::endl;
        return 1;
    }

    std::cout << "=== PRISM Offline Evaluation ===" << std::endl;
    std::cout << "Video:    " << opts.video << " @ " << fps << " fps" << std::endl;
    std::cout << "Method:   " << to_string(config.rppg_method)
              << (opts.strict ? " (strict)" : "") << std::endl;
    std::cout << "Stimulus: " << (opts.cycle_stimulus ? "cycle" : "none")
              << " / " << opts.hold_seconds << "s" << std::endl;
    std::cout << "Output:   " << opts.out_path << std::endl;

    LivenessSession session(config);

    cv::Mat image;
    uint64_t frame_index = 0;
    uint64_t rejected = 0;
    bool header_written = false;

    while (g_running && capture.read(image)) {
        const double timestamp_ms = static_cast<double>(frame_index) * 1000.0 / fps;
        if (opts.max_seconds > 0.0 && timestamp_ms > opts.max_seconds * 1000.0) break;

        // Whole frame stands in for the face locator output
        const cv::Rect forehead_rect = utils::default_forehead_rect(image.size());
        FrameBox frame(image, image(forehead_rect), scheduled_stimulus(timestamp_ms, opts), timestamp_ms);
        frame.sequence_id = frame_index;
        frame.metadata.face_box = cv::Rect(0, 0, image.cols, image.rows);
        frame.metadata.forehead_box = forehead_rect;

        SubmitOutcome outcome = session.submit_frame(frame);
        if (!outcome.accepted()) ++rejected;

        if (!header_written) {
            write_csv_header(csv, outcome.result.to_json()["details"]);
            header_written = true;
        }
        write_csv_row(csv, frame_index, frame, outcome);
        ++frame_index;
    }

    const LivenessResult& final_result = session.last_result();
    const std::string serialized = final_result.to_json().dump();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Frames:    " << frame_index << " (" << rejected << " rejected)" << std::endl;
    std::cout << "State:     " << to_string(session.state()) << std::endl;
    std::cout << "Decision:  " << (final_result.is_human ? "✓ HUMAN" : "✗ NOT HUMAN")
              << " (confidence " << std::fixed << std::setprecision(1)
              << final_result.confidence << ")" << std::endl;
    if (!final_result.details.forced_false_reason.empty()) {
        std::cout << "Forced:    " << final_result.details.forced_false_reason << std::endl;
    }
    std::cout << "Result:    " << final_result.to_json().dump(2) << std::endl;
    std::cout << "Digest:    " << CryptoUtils::sha256_hex(serialized) << std::endl;

    return 0;
}
