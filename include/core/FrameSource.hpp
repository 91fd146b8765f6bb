#pragma once

#include <opencv2/core.hpp>

namespace core {

/**
 * Delivers camera frames to the processing loop.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @return false when no frame could be read; the loop stops
     */
    virtual bool read(cv::Mat& frame) = 0;
};

} // namespace core
