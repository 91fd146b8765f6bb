/**
 * Palm Detector Implementation
 *
 * MediaPipe Palm Detection model inference via OpenCV DNN.
 * Handles letterbox preprocessing and anchor-based decoding.
 */

#include "inference/PalmDetector.hpp"
#include "core/Logger.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace inference {

namespace {

constexpr int BOX_STRIDE = 18;      // cx, cy, w, h + 7 keypoints * 2
constexpr int NUM_KEYPOINTS = 7;

float sigmoid(float x) {
    x = std::clamp(x, -100.0f, 100.0f);
    return 1.0f / (1.0f + std::exp(-x));
}

} // namespace

PalmDetector::PalmDetector() = default;

PalmDetector::~PalmDetector() = default;

bool PalmDetector::init(const Config& config) {
    config_ = config;

    try {
        net_ = cv::dnn::readNetFromONNX(config_.modelPath);
    } catch (const cv::Exception& e) {
        core::Logger::error("PalmDetector: Failed to load model ", config_.modelPath, ": ", e.what());
        return false;
    }
    if (net_.empty()) {
        core::Logger::error("PalmDetector: Empty network from ", config_.modelPath);
        return false;
    }
    outputNames_ = net_.getUnconnectedOutLayersNames();

    // Generate anchors for decoding
    generateAnchors();

    initialized_ = true;
    core::Logger::info("PalmDetector initialized");
    core::Logger::info("  Input: ", config_.inputWidth, "x", config_.inputHeight);
    core::Logger::info("  Anchors: ", anchors_.size());

    return true;
}

void PalmDetector::generateAnchors() {
    // MediaPipe Palm Detection uses SSD-style anchors with fixed size.
    // Strides 8, 16, 16, 16: layers sharing a stride are merged, each layer
    // contributes 2 anchors per cell.
    // 24x24 * 2 + 12x12 * 6 = 2016

    struct AnchorConfig {
        int stride;
        int numAnchors;
    };

    const std::vector<AnchorConfig> configs = {
        {8, 2},
        {16, 6}
    };

    anchors_.clear();

    for (const auto& cfg : configs) {
        int gridW = static_cast<int>(std::ceil(static_cast<float>(config_.inputWidth) / cfg.stride));
        int gridH = static_cast<int>(std::ceil(static_cast<float>(config_.inputHeight) / cfg.stride));
        for (int y = 0; y < gridH; ++y) {
            for (int x = 0; x < gridW; ++x) {
                for (int a = 0; a < cfg.numAnchors; ++a) {
                    anchors_.push_back({(x + 0.5f) / gridW, (y + 0.5f) / gridH});
                }
            }
        }
    }
}

PalmDetector::Letterbox PalmDetector::preprocess(const cv::Mat& bgrFrame, cv::Mat& blob) {
    Letterbox lb;
    lb.scale = std::min(static_cast<float>(config_.inputWidth) / bgrFrame.cols,
                        static_cast<float>(config_.inputHeight) / bgrFrame.rows);

    int newW = static_cast<int>(std::round(bgrFrame.cols * lb.scale));
    int newH = static_cast<int>(std::round(bgrFrame.rows * lb.scale));
    int padX = (config_.inputWidth - newW) / 2;
    int padY = (config_.inputHeight - newH) / 2;

    cv::Mat resized;
    cv::resize(bgrFrame, resized, cv::Size(newW, newH), 0, 0, cv::INTER_LINEAR);
    cv::copyMakeBorder(resized, letterboxed_,
                       padY, config_.inputHeight - newH - padY,
                       padX, config_.inputWidth - newW - padX,
                       cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));

    lb.offX = static_cast<float>(padX) / config_.inputWidth;
    lb.offY = static_cast<float>(padY) / config_.inputHeight;
    lb.scaleX = static_cast<float>(newW) / config_.inputWidth;
    lb.scaleY = static_cast<float>(newH) / config_.inputHeight;

    // NCHW, RGB, normalized to [0, 1]
    blob = cv::dnn::blobFromImage(letterboxed_, 1.0 / 255.0, cv::Size(), cv::Scalar(), true, false);
    return lb;
}

std::vector<PalmDetector::Detection> PalmDetector::detectAll(const cv::Mat& bgrFrame, int maxHands) {
    if (!initialized_) {
        core::Logger::error("PalmDetector not initialized");
        return {};
    }

    cv::Mat blob;
    Letterbox lb = preprocess(bgrFrame, blob);

    net_.setInput(blob);
    std::vector<cv::Mat> outputs;
    net_.forward(outputs, outputNames_);

    // Model has 2 outputs:
    // regressors: [2016, 18] - box + keypoint offsets
    // classificators: [2016, 1] - raw scores
    const size_t numAnchors = anchors_.size();
    cv::Mat boxes, scores;
    for (const auto& out : outputs) {
        if (out.total() == numAnchors * BOX_STRIDE) {
            boxes = out.reshape(1, static_cast<int>(numAnchors));
        } else if (out.total() == numAnchors) {
            scores = out.reshape(1, static_cast<int>(numAnchors));
        }
    }
    if (boxes.empty() || scores.empty()) {
        core::Logger::error("PalmDetector: Unexpected output shapes for ", numAnchors, " anchors");
        return {};
    }

    auto detections = nmsMulti(decodeOutput(boxes, scores), maxHands);
    for (auto& det : detections) {
        unletterbox(det, lb);
    }
    return detections;
}

std::vector<PalmDetector::Detection> PalmDetector::decodeOutput(const cv::Mat& boxes, const cv::Mat& scores) const {
    std::vector<Detection> detections;

    const float inW = static_cast<float>(config_.inputWidth);
    const float inH = static_cast<float>(config_.inputHeight);

    for (size_t i = 0; i < anchors_.size(); ++i) {
        float score = sigmoid(scores.at<float>(static_cast<int>(i), 0));
        if (score < config_.scoreThreshold) {
            continue;
        }

        const float* raw = boxes.ptr<float>(static_cast<int>(i));
        const Anchor& anchor = anchors_[i];

        Detection det;
        det.score = score;

        // Offsets are in model input pixels relative to the anchor center
        det.x = anchor.x + raw[0] / inW;
        det.y = anchor.y + raw[1] / inH;
        det.width = raw[2] / inW;
        det.height = raw[3] / inH;

        for (int k = 0; k < NUM_KEYPOINTS; ++k) {
            det.keypoints[k * 2 + 0] = anchor.x + raw[4 + k * 2 + 0] / inW;
            det.keypoints[k * 2 + 1] = anchor.y + raw[4 + k * 2 + 1] / inH;
        }

        detections.push_back(det);
    }

    return detections;
}

std::vector<PalmDetector::Detection> PalmDetector::nmsMulti(const std::vector<Detection>& detections,
                                                            int maxHands) const {
    if (detections.empty()) return {};

    std::vector<cv::Rect2d> rects;
    std::vector<float> scores;
    rects.reserve(detections.size());
    scores.reserve(detections.size());
    for (const auto& det : detections) {
        rects.emplace_back(det.x - det.width / 2.0, det.y - det.height / 2.0, det.width, det.height);
        scores.push_back(det.score);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(rects, scores, config_.scoreThreshold, config_.nmsThreshold, keep, 1.0f, maxHands);

    std::vector<Detection> result;
    result.reserve(keep.size());
    for (int idx : keep) {
        result.push_back(detections[idx]);
    }
    return result;
}

void PalmDetector::unletterbox(Detection& det, const Letterbox& lb) const {
    const float scaleX = lb.scaleX;
    const float scaleY = lb.scaleY;

    // Transform center
    det.x = (det.x - lb.offX) / scaleX;
    det.y = (det.y - lb.offY) / scaleY;
    det.width /= scaleX;
    det.height /= scaleY;

    // Transform keypoints
    for (int k = 0; k < NUM_KEYPOINTS; ++k) {
        det.keypoints[k * 2 + 0] = (det.keypoints[k * 2 + 0] - lb.offX) / scaleX;
        det.keypoints[k * 2 + 1] = (det.keypoints[k * 2 + 1] - lb.offY) / scaleY;
    }
}

} // namespace inference
