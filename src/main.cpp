#include "core/Logger.hpp"
#include "core/Config.hpp"
#include "core/Types.hpp"
#include "core/EngineState.hpp"
#include "core/CalibrationController.hpp"
#include "core/FrameProcessor.hpp"
#include "core/CaptureSource.hpp"
#include "core/Overlay.hpp"
#include "core/ProcessingLoop.hpp"
#include "inference/HandLandmarkDetector.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <atomic>
#include <iostream>
#include <memory>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char** argv) {
    core::AppConfig config;
    try {
        config = core::AppConfig::fromArgs(argc, argv);
    } catch (const core::ConfigError& e) {
        core::Logger::error("Configuration: ", e.what());
        std::cerr << core::AppConfig::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << core::AppConfig::usage(argv[0]);
        return 0;
    }

    core::Logger::setLevel(config.logLevel);

    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::info("Starting HandSqueeze...");

    try {
        // 1. OSC output
        net::OscSender oscSender(config.oscHost, config.oscPort);
        if (!oscSender.start()) {
            return 1;
        }

        // 2. Landmark detector
        inference::HandLandmarkDetector::Config detectorConfig;
        detectorConfig.palm.modelPath = config.palmModelPath;
        detectorConfig.palm.scoreThreshold = config.detectionConfidence;
        detectorConfig.landmark.modelPath = config.landmarkModelPath;
        detectorConfig.landmark.presenceThreshold = config.presenceConfidence;
        detectorConfig.maxHands = config.maxHands;
        detectorConfig.handednessConfidence = config.handednessConfidence;

        inference::HandLandmarkDetector detector;
        if (!detector.init(detectorConfig)) {
            core::Logger::error("Failed to initialize hand landmark detector.");
            return 1;
        }

        // 3. Camera
        core::CaptureSource capture;
        if (!capture.open(config.cameraIndex, config.mirror)) {
            return 1;
        }

        // 4. Pipeline state, lives for the whole run
        core::EngineState state(static_cast<size_t>(config.smoothingWindow));
        core::CalibrationController calibration(state.ranges);
        core::FrameProcessor processor(state, oscSender);

        std::unique_ptr<core::PreviewWindow> preview;
        if (config.showPreview) {
            preview = std::make_unique<core::PreviewWindow>(config.windowTitle);
        }

        core::ProcessingLoop loop(capture, detector, processor, calibration, preview.get(), g_running);
        loop.run();

    } catch (const std::exception& e) {
        core::Logger::error("Fatal error in tracking loop: ", e.what());
        return 1;
    }

    core::Logger::info("Tracker stopped");
    return 0;
}
