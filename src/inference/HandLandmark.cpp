/**
 * Hand Landmark Implementation
 *
 * MediaPipe Hand Landmark model inference via OpenCV DNN.
 * Extracts a rotated ROI based on palm detection, runs landmark inference.
 */

#include "inference/HandLandmark.hpp"
#include "core/Logger.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace inference {

namespace {

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

float normalizeRadians(float angle) {
    return angle - 2.0f * static_cast<float>(CV_PI) *
        std::floor((angle + static_cast<float>(CV_PI)) / (2.0f * static_cast<float>(CV_PI)));
}

} // namespace

HandLandmark::HandLandmark() = default;

HandLandmark::~HandLandmark() = default;

bool HandLandmark::init(const Config& config) {
    config_ = config;

    try {
        net_ = cv::dnn::readNetFromONNX(config_.modelPath);
    } catch (const cv::Exception& e) {
        core::Logger::error("HandLandmark: Failed to load model ", config_.modelPath, ": ", e.what());
        return false;
    }
    if (net_.empty()) {
        core::Logger::error("HandLandmark: Empty network from ", config_.modelPath);
        return false;
    }

    // Identity (screen landmarks), Identity_1 (presence), Identity_2 (handedness),
    // Identity_3 (world landmarks, metres)
    outputNames_ = net_.getUnconnectedOutLayersNames();
    std::sort(outputNames_.begin(), outputNames_.end());

    initialized_ = true;
    core::Logger::info("HandLandmark initialized");
    core::Logger::info("  Input: ", config_.inputWidth, "x", config_.inputHeight);
    core::Logger::info("  Outputs: ", outputNames_.size());

    return true;
}

std::optional<HandLandmark::Result> HandLandmark::infer(const cv::Mat& bgrFrame,
                                                        const PalmDetector::Detection& palm) {
    if (!initialized_) {
        core::Logger::error("HandLandmark not initialized");
        return std::nullopt;
    }

    Roi roi = computeRoi(palm, bgrFrame.cols, bgrFrame.rows);
    if (roi.size < 1.0f) {
        return std::nullopt;
    }

    cv::Mat blob;
    extractROI(bgrFrame, roi, blob);

    net_.setInput(blob);
    std::vector<cv::Mat> outputs;
    net_.forward(outputs, outputNames_);

    auto result = parseOutput(outputs);
    if (!result || result->presence < config_.presenceThreshold) {
        return std::nullopt;
    }

    transformToFrameCoords(*result, roi, bgrFrame.cols, bgrFrame.rows);
    return result;
}

HandLandmark::Roi HandLandmark::computeRoi(const PalmDetector::Detection& palm,
                                           int frameWidth, int frameHeight) const {
    const float w = palm.width * frameWidth;
    const float h = palm.height * frameHeight;

    // Wrist (keypoint 0) -> middle finger MCP (keypoint 2), in pixels
    const float x0 = palm.keypoints[0] * frameWidth;
    const float y0 = palm.keypoints[1] * frameHeight;
    const float x2 = palm.keypoints[4] * frameWidth;
    const float y2 = palm.keypoints[5] * frameHeight;

    Roi roi;
    roi.rotation = normalizeRadians(static_cast<float>(CV_PI) / 2.0f - std::atan2(-(y2 - y0), x2 - x0));

    // Shift towards the fingers along the rotated y axis
    roi.centerX = palm.x * frameWidth - h * config_.roiShiftY * std::sin(roi.rotation);
    roi.centerY = palm.y * frameHeight + h * config_.roiShiftY * std::cos(roi.rotation);
    roi.size = std::max(w, h) * config_.roiScale;

    return roi;
}

cv::Point2f HandLandmark::roiToFrame(const Roi& roi, float u, float v) {
    const float du = (u - 0.5f) * roi.size;
    const float dv = (v - 0.5f) * roi.size;
    const float c = std::cos(roi.rotation);
    const float s = std::sin(roi.rotation);
    return {roi.centerX + du * c - dv * s,
            roi.centerY + du * s + dv * c};
}

void HandLandmark::extractROI(const cv::Mat& bgrFrame, const Roi& roi, cv::Mat& blob) {
    const cv::Point2f src[3] = {
        roiToFrame(roi, 0.0f, 0.0f),
        roiToFrame(roi, 1.0f, 0.0f),
        roiToFrame(roi, 0.0f, 1.0f)
    };
    const cv::Point2f dst[3] = {
        {0.0f, 0.0f},
        {static_cast<float>(config_.inputWidth), 0.0f},
        {0.0f, static_cast<float>(config_.inputHeight)}
    };

    cv::Mat transform = cv::getAffineTransform(src, dst);
    cv::warpAffine(bgrFrame, crop_, transform, cv::Size(config_.inputWidth, config_.inputHeight),
                   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));

    // NCHW, RGB, normalized to [0, 1]
    blob = cv::dnn::blobFromImage(crop_, 1.0 / 255.0, cv::Size(), cv::Scalar(), true, false);
}

std::optional<HandLandmark::Result> HandLandmark::parseOutput(const std::vector<cv::Mat>& outputs) const {
    // MediaPipe Hand Landmark output format, in sorted output name order:
    // - 21 landmarks x 3 coords = 63 floats (in pixel coords of 224x224)
    // - Presence: 1 float (logit)
    // - Handedness: 1 float
    // - 21 world landmarks x 3 coords (metres), ignored
    const cv::Mat* landmarks = nullptr;
    std::vector<float> scalars;

    for (const auto& out : outputs) {
        if (out.total() >= core::LANDMARK_COUNT * 3) {
            // First landmark tensor is the screen one
            if (!landmarks) landmarks = &out;
        } else if (out.total() == 1) {
            scalars.push_back(out.ptr<float>()[0]);
        }
    }

    if (!landmarks || scalars.size() < 2) {
        core::Logger::error("HandLandmark: Unexpected model outputs (", outputs.size(), ")");
        return std::nullopt;
    }

    Result result;
    const float* data = landmarks->ptr<float>();
    for (size_t i = 0; i < core::LANDMARK_COUNT; ++i) {
        result.landmarks[i].x = data[i * 3 + 0] / config_.inputWidth;
        result.landmarks[i].y = data[i * 3 + 1] / config_.inputHeight;
    }

    result.presence = sigmoid(scalars[0]);
    result.handedness = scalars[1];

    return result;
}

void HandLandmark::transformToFrameCoords(Result& result, const Roi& roi,
                                          int frameWidth, int frameHeight) const {
    for (auto& lm : result.landmarks) {
        cv::Point2f p = roiToFrame(roi, lm.x, lm.y);

        // Clamp to [0, 1]
        lm.x = std::clamp(p.x / frameWidth, 0.0f, 1.0f);
        lm.y = std::clamp(p.y / frameHeight, 0.0f, 1.0f);
    }
}

} // namespace inference
