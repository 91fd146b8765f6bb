#pragma once

#include <array>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

namespace inference {

/**
 * MediaPipe Palm Detection (192x192 SSD, 2016 anchors) via OpenCV DNN.
 *
 * Input: BGR frame of any size (letterboxed to the model input)
 * Output: Palm detections in normalized frame coordinates, best first
 */
class PalmDetector {
public:
    struct Detection {
        float x, y;             // Center (normalized 0-1)
        float width, height;    // Size (normalized)
        float score;            // Confidence

        // 7 keypoints x 2 coords (normalized). 0 = wrist, 2 = middle finger MCP
        std::array<float, 14> keypoints;
    };

    struct Config {
        std::string modelPath = "models/palm_detection.onnx";
        int inputWidth = 192;
        int inputHeight = 192;
        float scoreThreshold = 0.7f;
        float nmsThreshold = 0.3f;
    };

    PalmDetector();
    ~PalmDetector();

    /**
     * Load the model and generate anchors.
     * @return false if the model cannot be loaded
     */
    bool init(const Config& config);

    /**
     * Detect up to maxHands palms.
     * @return Detections sorted by score (best first)
     */
    std::vector<Detection> detectAll(const cv::Mat& bgrFrame, int maxHands = 2);

private:
    struct Anchor {
        float x, y;
    };

    struct Letterbox {
        float scale = 1.0f;
        float offX = 0.0f;      // Normalized to model input
        float offY = 0.0f;
        float scaleX = 1.0f;    // Content width / input width
        float scaleY = 1.0f;
    };

    Config config_;
    bool initialized_ = false;

    cv::dnn::Net net_;
    std::vector<std::string> outputNames_;
    std::vector<Anchor> anchors_;
    cv::Mat letterboxed_;

    void generateAnchors();
    Letterbox preprocess(const cv::Mat& bgrFrame, cv::Mat& blob);
    std::vector<Detection> decodeOutput(const cv::Mat& boxes, const cv::Mat& scores) const;
    std::vector<Detection> nmsMulti(const std::vector<Detection>& detections, int maxHands) const;
    void unletterbox(Detection& det, const Letterbox& lb) const;
};

} // namespace inference
