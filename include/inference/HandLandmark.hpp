#pragma once

#include "inference/PalmDetector.hpp"
#include "core/Types.hpp"
#include <optional>
#include <array>

namespace inference {

/**
 * MediaPipe Hand Landmark via OpenCV DNN.
 *
 * Input: Rotated square hand ROI derived from a palm detection
 * Output: 21 landmarks in normalized frame coordinates + handedness + presence
 */
class HandLandmark {
public:
    struct Result {
        core::Landmarks landmarks;
        float handedness;       // Probability of a right hand (mirrored input)
        float presence;         // Hand presence confidence
    };

    struct Config {
        std::string modelPath = "models/hand_landmark.onnx";
        int inputWidth = 224;   // MediaPipe uses 224x224
        int inputHeight = 224;
        float presenceThreshold = 0.7f;
        float roiScale = 2.6f;  // Palm box -> full hand
        float roiShiftY = -0.5f; // Towards the fingers, in palm box heights
    };

    /**
     * Hand region in frame pixels. rotation in radians, 0 = fingers up.
     */
    struct Roi {
        float centerX, centerY;
        float size;
        float rotation;
    };

    HandLandmark();
    ~HandLandmark();

    /**
     * Load the model.
     * @return false if the model cannot be loaded
     */
    bool init(const Config& config);

    /**
     * Infer landmarks for one palm.
     * @return Landmarks or nullopt if hand not present
     */
    std::optional<Result> infer(const cv::Mat& bgrFrame, const PalmDetector::Detection& palm);

    /**
     * ROI from palm detection: rotated so the wrist->middle MCP axis points
     * up, shifted towards the fingers and enlarged to cover the whole hand.
     */
    [[nodiscard]] Roi computeRoi(const PalmDetector::Detection& palm, int frameWidth, int frameHeight) const;

    /**
     * Map a point in ROI coordinates (0-1) to frame pixels.
     */
    [[nodiscard]] static cv::Point2f roiToFrame(const Roi& roi, float u, float v);

    /**
     * Decode the model outputs, ordered by output name.
     * Landmarks are returned in ROI coordinates (0-1).
     * @return nullopt if the outputs do not match the model layout
     */
    [[nodiscard]] std::optional<Result> parseOutput(const std::vector<cv::Mat>& outputs) const;

private:
    Config config_;
    bool initialized_ = false;

    cv::dnn::Net net_;
    std::vector<std::string> outputNames_;
    cv::Mat crop_;

    void extractROI(const cv::Mat& bgrFrame, const Roi& roi, cv::Mat& blob);
    void transformToFrameCoords(Result& result, const Roi& roi, int frameWidth, int frameHeight) const;
};

} // namespace inference
