/**
 * Try-On Replay Tool
 *
 * Replays a recorded landmark stream through the try-on pipeline and
 * writes the composited preview frames.
 *
 * Pipeline:
 *   1) Load the jewelry config and the landmark recording
 *   2) Run the frame scheduler over the recording
 *   3) Composite each overlay onto the background (or black)
 *   4) Save PNGs and print a tracking summary
 *
 * Usage:
 *   build/bin/tryon_replay --config <item.yaml> --landmarks <sequence.txt> \
 *                          --out-dir <output_dir> [--background <image>] \
 *                          [--every <N>] [--max-frames <N>]
 */

#include "config/JewelryConfig.h"
#include "landmarks/LandmarkSource.h"
#include "pipeline/FrameScheduler.h"
#include "pipeline/TryOnPipeline.h"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace jewelry_tryon;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --config <path>           Jewelry config (YAML)\n"
              << "  --landmarks <path>        Landmark recording (TXT)\n"
              << "  --out-dir <path>          Output directory for PNG frames\n"
              << "  --background <path>       Background image (optional, default black)\n"
              << "  --every <N>               Save every N-th frame (default: 1)\n"
              << "  --max-frames <N>          Stop after N processed frames (default: all)\n"
              << "  --help                    Show this help\n";
}

bool createDirectory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    #ifdef _WIN32
    return mkdir(path.c_str()) == 0;
    #else
    return mkdir(path.c_str(), 0755) == 0;
    #endif
}

int main(int argc, char* argv[]) {
    std::string config_path, landmarks_path, out_dir, background_path;
    int every = 1;
    int max_frames = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--landmarks" && i + 1 < argc) {
            landmarks_path = argv[++i];
        } else if (arg == "--out-dir" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg == "--background" && i + 1 < argc) {
            background_path = argv[++i];
        } else if (arg == "--every" && i + 1 < argc) {
            every = std::max(1, std::stoi(argv[++i]));
        } else if (arg == "--max-frames" && i + 1 < argc) {
            max_frames = std::stoi(argv[++i]);
        }
    }

    if (config_path.empty() || landmarks_path.empty() || out_dir.empty()) {
        std::cerr << "Error: Missing required arguments\n";
        printUsage(argv[0]);
        return 1;
    }

    if (!createDirectory(out_dir)) {
        std::cerr << "Error: Cannot create output directory " << out_dir << std::endl;
        return 1;
    }

    std::cout << "=== Try-On Replay ===\n" << std::endl;

    // ========================================================================
    // [1] Load config and background
    // ========================================================================
    std::cout << "[1] Loading jewelry config..." << std::endl;
    JewelryConfig config;
    try {
        config = JewelryConfig::loadFromFile(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "    Type: " << toString(config.type)
              << ", material: " << config.material.type
              << ", size: " << config.size << (config.auto_scale ? " (auto)" : "") << std::endl;

    cv::Mat background;
    if (!background_path.empty()) {
        background = cv::imread(background_path, cv::IMREAD_COLOR);
        if (background.empty()) {
            std::cerr << "    Warning: Failed to load background " << background_path
                      << ", using black" << std::endl;
        } else if (config.calibration.mirror) {
            // The overlay is mirrored, so the preview is as well
            cv::flip(background, background, 1);
        }
    }

    // ========================================================================
    // [2] Run the session
    // ========================================================================
    std::cout << "\n[2] Replaying " << landmarks_path << "..." << std::endl;
    RecordedLandmarkSource source(landmarks_path);
    std::unique_ptr<TryOnPipeline> pipeline;
    try {
        pipeline = std::make_unique<TryOnPipeline>(config, face_mesh::kLandmarkCountWithIris);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    CancellationToken token;
    int tick = 0;
    int saved = 0;
    int face_frames = 0;
    int drawn_frames = 0;
    int failed_writes = 0;

    FrameScheduler scheduler(source, *pipeline);
    SchedulerReport report = scheduler.run(token,
        [&](const FrameObservation& frame, const FrameResult& result, const TryOnPipeline& session) {
            if (result.face_detected) ++face_frames;
            if (result.drawn) ++drawn_frames;

            if (tick % every == 0 && frame.width > 0 && frame.height > 0) {
                cv::Mat preview;
                if (!background.empty()) {
                    cv::resize(background, preview, cv::Size(frame.width, frame.height));
                } else {
                    preview = cv::Mat::zeros(frame.height, frame.width, CV_8UC3);
                }

                if (session.getCompositor().compositeOnto(preview)) {
                    std::ostringstream name;
                    name << out_dir << "/frame_" << std::setw(5) << std::setfill('0') << tick << ".png";
                    if (cv::imwrite(name.str(), preview)) {
                        ++saved;
                    } else {
                        std::cerr << "    Warning: Failed to write " << name.str() << std::endl;
                        ++failed_writes;
                    }
                }
            }

            ++tick;
            if (max_frames > 0 && tick >= max_frames) {
                token.cancel();
            }
        });

    // ========================================================================
    // [3] Summary
    // ========================================================================
    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Frames processed:  " << report.frames_processed << std::endl;
    std::cout << "Frames skipped:    " << report.frames_skipped << " (stale timestamps)" << std::endl;
    std::cout << "Face detected:     " << face_frames << std::endl;
    std::cout << "Jewelry drawn:     " << drawn_frames << std::endl;
    std::cout << "PNGs written:      " << saved << " -> " << out_dir << std::endl;

    switch (report.status) {
        case SchedulerStatus::Completed:
            std::cout << "Status:            completed" << std::endl;
            break;
        case SchedulerStatus::Cancelled:
            std::cout << "Status:            stopped after " << max_frames << " frames" << std::endl;
            break;
        case SchedulerStatus::Failed:
            std::cerr << "Status:            failed (" << report.error << ")" << std::endl;
            return 1;
    }

    return failed_writes > 0 ? 1 : 0;
}
