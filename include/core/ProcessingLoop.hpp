#pragma once

#include <atomic>
#include <cstdint>
#include <opencv2/core.hpp>

#include "Types.hpp"
#include "CalibrationController.hpp"
#include "FrameDisplay.hpp"
#include "FrameSource.hpp"
#include "Overlay.hpp"

namespace inference {
    class LandmarkDetector;
}

namespace core {

class FrameProcessor;

/**
 * Frame-driven main loop, single threaded:
 * read frame -> detect hands -> process each hand -> draw -> show -> poll key.
 *
 * Calibration commands are applied between frames. The loop ends on quit,
 * on an unreadable frame, or when the running flag is cleared (signal).
 */
class ProcessingLoop {
public:
    /**
     * @param display Preview and key input; nullptr runs headless (no keys)
     * @param running Cleared on quit; the loop also stops when cleared externally
     */
    ProcessingLoop(FrameSource& source,
                   inference::LandmarkDetector& detector,
                   FrameProcessor& processor,
                   CalibrationController& calibration,
                   FrameDisplay* display,
                   std::atomic<bool>& running);

    /**
     * Run until stopped. Returns the number of processed frames.
     */
    uint64_t run();

private:
    void processFrame(cv::Mat& frame);

    // @return false if the loop should stop
    bool handleKey(int key);

    FrameSource& source_;
    inference::LandmarkDetector& detector_;
    FrameProcessor& processor_;
    CalibrationController& calibration_;
    FrameDisplay* display_;
    std::atomic<bool>& running_;

    Overlay overlay_;
    cv::Mat frame_;
    uint64_t frameCount_ = 0;
};

} // namespace core
