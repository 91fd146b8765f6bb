#pragma once

#include <opencv2/core.hpp>

namespace core {

/**
 * Shows the annotated frame and reports user key presses.
 */
class FrameDisplay {
public:
    virtual ~FrameDisplay() = default;

    virtual void show(const cv::Mat& frame) = 0;

    /**
     * Non-blocking.
     * @return key code or -1 if none
     */
    virtual int pollKey() = 0;
};

} // namespace core
