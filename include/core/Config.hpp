#pragma once

#include <stdexcept>
#include <string>
#include "Types.hpp"
#include "Logger.hpp"

namespace core {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Application configuration.
 *
 * Precedence (lowest first): defaults below, a config file passed with
 * --config (YAML/XML/JSON via cv::FileStorage), command-line flags.
 */
struct AppConfig {
    // Capture
    int cameraIndex = 0;
    bool mirror = true;

    // Preview
    bool showPreview = true;
    std::string windowTitle = "Dynamic Hand Tracking";

    // OSC
    std::string oscHost = DEFAULT_OSC_HOST;
    std::string oscPort = DEFAULT_OSC_PORT;

    // Pipeline
    int smoothingWindow = static_cast<int>(DEFAULT_SMOOTHING_WINDOW);

    // Detection
    std::string palmModelPath = "models/palm_detection.onnx";
    std::string landmarkModelPath = "models/hand_landmark.onnx";
    int maxHands = 2;
    float detectionConfidence = 0.7f;
    float presenceConfidence = 0.7f;
    float handednessConfidence = 0.6f;

    LogLevel logLevel = LogLevel::INFO;

    bool showHelp = false;

    /**
     * Throws ConfigError if a value is out of range.
     */
    void validate() const;

    /**
     * Overlay values from a cv::FileStorage file. Keys that are absent keep
     * their current value. Throws ConfigError if the file cannot be opened.
     */
    void loadFile(const std::string& path);

    /**
     * Build a config from the command line (including --config).
     * Throws ConfigError on unknown flags or missing values.
     */
    static AppConfig fromArgs(int argc, char** argv);

    static std::string usage(const char* program);
};

} // namespace core
