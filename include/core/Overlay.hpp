#pragma once

#include <chrono>
#include <string>
#include <opencv2/core.hpp>

#include "Types.hpp"
#include "CalibrationController.hpp"
#include "FrameDisplay.hpp"

namespace core {

/**
 * On-screen preview window. Destroyed in the destructor.
 */
class PreviewWindow : public FrameDisplay {
public:
    explicit PreviewWindow(std::string title);
    ~PreviewWindow() override;

    // Non-copyable
    PreviewWindow(const PreviewWindow&) = delete;
    PreviewWindow& operator=(const PreviewWindow&) = delete;

    void show(const cv::Mat& frame) override;

    /**
     * Key poll, waits 1 ms.
     */
    int pollKey() override;

private:
    std::string title_;
};

/**
 * Draws the per-hand metric readout, the hand skeleton and the status line.
 */
class Overlay {
public:
    Overlay() = default;

    /**
     * Call once per frame; updates the FPS estimate.
     */
    void beginFrame();

    void drawHand(cv::Mat& frame, const HandMetrics& metrics, CalibrationStatus status) const;
    void drawStatus(cv::Mat& frame, int handCount) const;

private:
    std::chrono::steady_clock::time_point lastFpsTime_ = std::chrono::steady_clock::now();
    int frameCount_ = 0;
    float currentFps_ = 0.0f;
};

} // namespace core
