#include "inference/HandLandmarkDetector.hpp"
#include "core/Logger.hpp"

namespace inference {

bool HandLandmarkDetector::init(const Config& config) {
    config_ = config;

    if (!palmDetector_.init(config_.palm)) {
        return false;
    }
    if (!handLandmark_.init(config_.landmark)) {
        return false;
    }
    return true;
}

std::optional<core::Hand> HandLandmarkDetector::labelFromScore(float rightScore, float minConfidence) {
    if (rightScore >= minConfidence) {
        return core::Hand::Right;
    }
    if (1.0f - rightScore >= minConfidence) {
        return core::Hand::Left;
    }
    return std::nullopt;
}

std::vector<core::HandFrame> HandLandmarkDetector::detect(const cv::Mat& bgrFrame) {
    std::vector<core::HandFrame> hands;
    if (bgrFrame.empty()) {
        return hands;
    }

    auto palms = palmDetector_.detectAll(bgrFrame, config_.maxHands);
    hands.reserve(palms.size());

    for (const auto& palm : palms) {
        auto landmarks = handLandmark_.infer(bgrFrame, palm);
        if (!landmarks) {
            continue;
        }

        core::HandFrame hand;
        hand.landmarks = landmarks->landmarks;
        hand.label = labelFromScore(landmarks->handedness, config_.handednessConfidence);
        hands.push_back(hand);
    }

    core::Logger::debug("HandLandmarkDetector: ", palms.size(), " palms, ", hands.size(), " hands");
    return hands;
}

} // namespace inference
