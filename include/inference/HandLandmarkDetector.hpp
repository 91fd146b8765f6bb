#pragma once

#include "inference/LandmarkDetector.hpp"
#include "inference/PalmDetector.hpp"
#include "inference/HandLandmark.hpp"

namespace inference {

/**
 * Two-stage detector: palm detection on the full frame, then hand landmarks
 * on one ROI per palm.
 */
class HandLandmarkDetector : public LandmarkDetector {
public:
    struct Config {
        PalmDetector::Config palm;
        HandLandmark::Config landmark;
        int maxHands = 2;

        // Below this the handedness label is reported as unknown
        float handednessConfidence = 0.6f;
    };

    HandLandmarkDetector() = default;
    ~HandLandmarkDetector() override = default;

    /**
     * Load both models.
     * @return false if either model cannot be loaded
     */
    bool init(const Config& config);

    std::vector<core::HandFrame> detect(const cv::Mat& bgrFrame) override;

    /**
     * Map the landmark model's handedness score to a label.
     * @return nullopt if neither side reaches minConfidence
     */
    [[nodiscard]] static std::optional<core::Hand> labelFromScore(float rightScore, float minConfidence);

private:
    Config config_;
    PalmDetector palmDetector_;
    HandLandmark handLandmark_;
};

} // namespace inference
