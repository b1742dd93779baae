#include "core/Config.hpp"
#include "core/LandmarkReplay.hpp"
#include "core/LatestValue.hpp"
#include "core/Logger.hpp"
#include "core/ProcessingLoop.hpp"
#include "net/OscActionSink.hpp"
#include "net/OscLandmarkReceiver.hpp"
#include "render/DebugOverlay.hpp"
#include <opencv2/highgui.hpp>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    core::Logger::info("Interrupt signal (", signum, ") received. Shutting down...");
    g_running = false;
}

namespace {

struct ServiceConfig {
    std::string oscHost = "127.0.0.1";   // Action executor
    std::string oscPort = "9000";
    std::string listenPort = "9001";     // Landmark detector sends here
    std::string replayPath;              // Offline run instead of OSC input
    std::string preset = "default";
    float frameWidth = 640.0f;
    float frameHeight = 480.0f;
    float tickRateHz = 60.0f;
    bool preview = false;
    bool pinkyExitsMode = false;
    core::LogLevel logLevel = core::LogLevel::INFO;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --osc-host HOST      action executor host (default 127.0.0.1)\n"
              << "  --osc-port PORT      action executor port (default 9000)\n"
              << "  --listen-port PORT   landmark input port (default 9001)\n"
              << "  --replay FILE        run a recorded landmark file instead of OSC input\n"
              << "  --preset NAME        default | responsive | decibel\n"
              << "  --frame-size WxH     landmark pixel space (default 640x480)\n"
              << "  --tick-rate HZ       processing rate (default 60)\n"
              << "  --pinky-exit         pinky-up poses return to Idle\n"
              << "  --preview            show the diagnostic overlay window\n"
              << "  --log-level LEVEL    debug | info | warn | error\n";
}

bool parseArgs(int argc, char** argv, ServiceConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                core::Logger::error("Missing value for ", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--osc-host") {
            if (!next(config.oscHost)) return false;
        } else if (arg == "--osc-port") {
            if (!next(config.oscPort)) return false;
        } else if (arg == "--listen-port") {
            if (!next(config.listenPort)) return false;
        } else if (arg == "--replay") {
            if (!next(config.replayPath)) return false;
        } else if (arg == "--preset") {
            if (!next(config.preset)) return false;
        } else if (arg == "--frame-size") {
            if (!next(value)) return false;
            int w = 0, h = 0;
            if (std::sscanf(value.c_str(), "%dx%d", &w, &h) != 2 || w <= 0 || h <= 0) {
                core::Logger::error("Invalid --frame-size: ", value);
                return false;
            }
            config.frameWidth = static_cast<float>(w);
            config.frameHeight = static_cast<float>(h);
        } else if (arg == "--tick-rate") {
            if (!next(value)) return false;
            config.tickRateHz = std::strtof(value.c_str(), nullptr);
            if (config.tickRateHz <= 0.0f) {
                core::Logger::error("Invalid --tick-rate: ", value);
                return false;
            }
        } else if (arg == "--pinky-exit") {
            config.pinkyExitsMode = true;
        } else if (arg == "--preview") {
            config.preview = true;
        } else if (arg == "--log-level") {
            if (!next(value)) return false;
            if (!core::Logger::parseLevel(value, config.logLevel)) {
                core::Logger::error("Invalid --log-level: ", value);
                return false;
            }
        } else {
            core::Logger::error("Unknown option: ", arg);
            return false;
        }
    }
    return true;
}

bool buildControllerConfig(const ServiceConfig& service, core::ControllerConfig& out) {
    if (service.preset == "default") {
        out = core::getDefaultConfig();
    } else if (service.preset == "responsive") {
        out = core::getResponsiveConfig();
    } else if (service.preset == "decibel") {
        out = core::getDecibelVolumeConfig();
    } else {
        core::Logger::error("Unknown preset: ", service.preset);
        return false;
    }
    out.gesture.pinkyExitsMode = service.pinkyExitsMode;

    auto problems = out.validate();
    for (const auto& problem : problems) {
        core::Logger::error("Config: ", problem);
    }
    return problems.empty();
}

/**
 * Deterministic offline run: recorded timestamps drive the ticks
 */
int runReplay(const ServiceConfig& service, const core::ControllerConfig& controllerConfig,
              std::shared_ptr<core::ActionSink> sink) {
    core::LandmarkReplay replay;
    if (!replay.load(service.replayPath)) {
        return 1;
    }

    core::ProcessingLoop::Config loopConfig;
    loopConfig.tickRateHz = service.tickRateHz;
    core::ProcessingLoop processor(std::make_shared<core::LandmarkSlot>(), std::move(sink),
                                   controllerConfig, loopConfig);

    render::DebugOverlay overlay(controllerConfig);
    auto start = std::chrono::steady_clock::now();
    int volumeEmissions = 0;
    int scrollEmissions = 0;

    for (size_t i = 0; i < replay.size() && g_running; ++i) {
        core::LandmarkFrame frame = replay.frameAt(i, start);
        const core::LandmarkFrame* input = frame.landmarks.empty() ? nullptr : &frame;
        core::TickResult result = processor.processFrame(input, frame.timestamp);

        if (result.volumeLevel) volumeEmissions++;
        if (result.scrollClicks) scrollEmissions++;

        if (service.preview) {
            cv::Mat canvas = render::DebugOverlay::makeCanvas(static_cast<int>(service.frameWidth),
                                                              static_cast<int>(service.frameHeight));
            overlay.draw(canvas, input, result, processor.getMeasuredTickRate());
            cv::imshow("GhostTouch", canvas);
            if ((cv::waitKey(1) & 0xFF) == 'q') break;
        }
    }

    core::Logger::info("Replay finished: ", processor.getTickCount(), " ticks, ", volumeEmissions,
                       " volume and ", scrollEmissions, " scroll emissions, final mode ",
                       core::toString(processor.controller().getMode()));
    return 0;
}

int runService(const ServiceConfig& service, const core::ControllerConfig& controllerConfig,
               std::shared_ptr<core::ActionSink> sink) {
    auto landmarkSlot = std::make_shared<core::LandmarkSlot>();

    net::OscLandmarkReceiver receiver(landmarkSlot, service.listenPort, service.frameWidth, service.frameHeight);
    if (!receiver.start()) {
        return 1;
    }

    // Overlay is rendered on the processing thread, shown on this one
    render::DebugOverlay overlay(controllerConfig);
    core::LatestValue<cv::Mat> previewSlot;

    core::ProcessingLoop::Config loopConfig;
    loopConfig.tickRateHz = service.tickRateHz;
    core::ProcessingLoop processingLoop(landmarkSlot, std::move(sink), controllerConfig, loopConfig);
    if (service.preview) {
        processingLoop.setPreviewCallback([&](const core::LandmarkFrame* frame, const core::TickResult& result) {
            cv::Mat canvas = render::DebugOverlay::makeCanvas(static_cast<int>(service.frameWidth),
                                                              static_cast<int>(service.frameHeight));
            overlay.draw(canvas, frame, result, processingLoop.getMeasuredTickRate());
            previewSlot.publish(std::move(canvas));
        });
    }

    processingLoop.start();
    core::Logger::info("Service running. Press Ctrl+C to exit.");

    // Main loop (Orchestrator)
    while (g_running) {
        if (service.preview) {
            if (auto canvas = previewSlot.take()) {
                cv::imshow("GhostTouch", *canvas);
            }
            if ((cv::waitKey(15) & 0xFF) == 'q') {
                g_running = false;
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    // Shutdown: Stop explicitly to ensure clean cleanup order
    core::Logger::info("Stopping modules...");
    receiver.stop();
    processingLoop.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    ServiceConfig service;
    if (!parseArgs(argc, argv, service)) {
        printUsage(argv[0]);
        return 2;
    }
    core::Logger::setLevel(service.logLevel);

    core::Logger::info("Starting GhostTouch gesture control service (log level ",
                       core::Logger::levelName(service.logLevel), ")...");

    core::ControllerConfig controllerConfig;
    if (!buildControllerConfig(service, controllerConfig)) {
        return 2;
    }

    int exitCode = 0;
    try {
        auto sink = std::make_shared<net::OscActionSink>(service.oscHost, service.oscPort);
        if (!sink->start()) {
            return 1;
        }

        exitCode = service.replayPath.empty()
                       ? runService(service, controllerConfig, sink)
                       : runReplay(service, controllerConfig, sink);
    } catch (const std::exception& e) {
        core::Logger::error("Fatal error in service loop: ", e.what());
        exitCode = 1;
    }

    if (service.preview) {
        cv::destroyAllWindows();
    }

    core::Logger::info("Service stopped cleanly.");
    return exitCode;
}
