#include "core/Config.hpp"
#include <opencv2/core/persistence.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace core {

namespace {

void readInt(const cv::FileNode& node, int& out) {
    if (!node.empty()) out = static_cast<int>(node);
}

void readFloat(const cv::FileNode& node, float& out) {
    if (!node.empty()) out = static_cast<float>(node);
}

void readString(const cv::FileNode& node, std::string& out) {
    if (!node.empty()) out = static_cast<std::string>(node);
}

// YAML true/false load as strings, 0/1 as numbers
void readBool(const cv::FileNode& node, const char* key, bool& out) {
    if (node.empty()) return;

    if (node.isInt()) {
        out = static_cast<int>(node) != 0;
        return;
    }
    if (node.isString()) {
        std::string value = static_cast<std::string>(node);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "true" || value == "yes" || value == "on" || value == "1") {
            out = true;
            return;
        }
        if (value == "false" || value == "no" || value == "off" || value == "0") {
            out = false;
            return;
        }
    }
    throw ConfigError(std::string("Invalid boolean for ") + key);
}

int toInt(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + flag + ": '" + value + "'");
    }
}

} // namespace

void AppConfig::validate() const {
    if (cameraIndex < 0) {
        throw ConfigError("camera index must be >= 0");
    }
    if (smoothingWindow < 1 || smoothingWindow > static_cast<int>(MAX_SMOOTHING_WINDOW)) {
        throw ConfigError("smoothing window must be in [1, " + std::to_string(MAX_SMOOTHING_WINDOW) + "]");
    }
    if (maxHands < 1 || maxHands > static_cast<int>(HAND_COUNT)) {
        throw ConfigError("max hands must be 1 or 2");
    }
    auto checkUnit = [](float v, const char* name) {
        if (v < 0.0f || v > 1.0f) {
            throw ConfigError(std::string(name) + " must be in [0, 1]");
        }
    };
    checkUnit(detectionConfidence, "detection confidence");
    checkUnit(presenceConfidence, "presence confidence");
    checkUnit(handednessConfidence, "handedness confidence");

    if (oscHost.empty() || oscPort.empty()) {
        throw ConfigError("OSC host and port must not be empty");
    }
}

void AppConfig::loadFile(const std::string& path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }
    if (!fs.isOpened()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    readInt(fs["camera_index"], cameraIndex);
    readBool(fs["mirror"], "mirror", mirror);
    readBool(fs["show_preview"], "show_preview", showPreview);
    readString(fs["window_title"], windowTitle);
    readString(fs["osc_host"], oscHost);

    // Port may be written as a number or a string
    cv::FileNode port = fs["osc_port"];
    if (!port.empty()) {
        oscPort = port.isString() ? static_cast<std::string>(port)
                                  : std::to_string(static_cast<int>(port));
    }

    readInt(fs["smoothing_window"], smoothingWindow);
    readString(fs["palm_model"], palmModelPath);
    readString(fs["landmark_model"], landmarkModelPath);
    readInt(fs["max_hands"], maxHands);
    readFloat(fs["detection_confidence"], detectionConfidence);
    readFloat(fs["presence_confidence"], presenceConfidence);
    readFloat(fs["handedness_confidence"], handednessConfidence);

    bool verbose = false;
    readBool(fs["verbose"], "verbose", verbose);
    if (verbose) logLevel = LogLevel::DEBUG;
}

AppConfig AppConfig::fromArgs(int argc, char** argv) {
    AppConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);

    // The config file is the lower layer, apply it before the other flags
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("--config requires a value");
            config.loadFile(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError(arg + " requires a value");
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--config") {
            value();
        } else if (arg == "--camera") {
            config.cameraIndex = toInt(arg, value());
        } else if (arg == "--host") {
            config.oscHost = value();
        } else if (arg == "--port") {
            config.oscPort = value();
        } else if (arg == "--window") {
            config.smoothingWindow = toInt(arg, value());
        } else if (arg == "--palm-model") {
            config.palmModelPath = value();
        } else if (arg == "--landmark-model") {
            config.landmarkModelPath = value();
        } else if (arg == "--max-hands") {
            config.maxHands = toInt(arg, value());
        } else if (arg == "--no-mirror") {
            config.mirror = false;
        } else if (arg == "--no-preview") {
            config.showPreview = false;
        } else if (arg == "--verbose" || arg == "-v") {
            config.logLevel = LogLevel::DEBUG;
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }

    if (!config.showHelp) {
        config.validate();
    }
    return config;
}

std::string AppConfig::usage(const char* program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "  --config <file>          YAML/XML/JSON config file\n"
       << "  --camera <index>         Capture device index (default 0)\n"
       << "  --host <host>            OSC target host (default " << DEFAULT_OSC_HOST << ")\n"
       << "  --port <port>            OSC target port (default " << DEFAULT_OSC_PORT << ")\n"
       << "  --window <n>             Smoothing window in frames (default " << DEFAULT_SMOOTHING_WINDOW << ")\n"
       << "  --palm-model <path>      Palm detection ONNX model\n"
       << "  --landmark-model <path>  Hand landmark ONNX model\n"
       << "  --max-hands <1|2>        Maximum hands per frame (default 2)\n"
       << "  --no-mirror              Do not flip the frame horizontally\n"
       << "  --no-preview             Run without the preview window\n"
       << "  -v, --verbose            Debug logging\n"
       << "  -h, --help               Show this help\n"
       << "\n"
       << "Keys: q quit, 3/4 lock left min/max, 5/6 lock right min/max, c clear calibration\n";
    return ss.str();
}

} // namespace core
