#include "core/ProcessingLoop.hpp"
#include "core/FrameProcessor.hpp"
#include "core/KeyBindings.hpp"
#include "core/Logger.hpp"
#include "inference/LandmarkDetector.hpp"

namespace core {

ProcessingLoop::ProcessingLoop(FrameSource& source,
                               inference::LandmarkDetector& detector,
                               FrameProcessor& processor,
                               CalibrationController& calibration,
                               FrameDisplay* display,
                               std::atomic<bool>& running)
    : source_(source),
      detector_(detector),
      processor_(processor),
      calibration_(calibration),
      display_(display),
      running_(running) {
}

uint64_t ProcessingLoop::run() {
    Logger::info("Press 'q' to quit");

    while (running_) {
        if (!source_.read(frame_)) {
            Logger::info("ProcessingLoop: No frame from camera, stopping.");
            break;
        }

        processFrame(frame_);
        frameCount_++;

        if (display_) {
            display_->show(frame_);
            if (!handleKey(display_->pollKey())) {
                break;
            }
        }
    }

    Logger::info("ProcessingLoop: ", frameCount_, " frames processed.");
    return frameCount_;
}

void ProcessingLoop::processFrame(cv::Mat& frame) {
    overlay_.beginFrame();

    auto hands = detector_.detect(frame);

    for (const auto& hand : hands) {
        HandMetrics metrics = processor_.process(hand, frame.cols, frame.rows);
        if (display_) {
            overlay_.drawHand(frame, metrics, calibration_.status(metrics.hand));
        }
    }

    if (display_) {
        overlay_.drawStatus(frame, static_cast<int>(hands.size()));
    }
}

bool ProcessingLoop::handleKey(int key) {
    auto command = commandForKey(key);
    if (!command) {
        return true;
    }
    if (*command == Command::Quit) {
        Logger::info("ProcessingLoop: Quit requested.");
        running_ = false;
        return false;
    }
    calibration_.apply(*command);
    return true;
}

} // namespace core
