#pragma once

#include <opencv2/videoio.hpp>
#include "FrameSource.hpp"

namespace core {

/**
 * Owns the camera. The device is released in the destructor on every exit
 * path, including a failed open.
 */
class CaptureSource : public FrameSource {
public:
    CaptureSource() = default;
    ~CaptureSource() override;

    // Non-copyable
    CaptureSource(const CaptureSource&) = delete;
    CaptureSource& operator=(const CaptureSource&) = delete;

    /**
     * Open the capture device.
     * @return false if the device is unavailable
     */
    bool open(int deviceIndex, bool mirror = true);

    /**
     * Grab the next BGR frame, mirrored horizontally if configured.
     * @return false when no frame could be read (end of stream, unplugged)
     */
    bool read(cv::Mat& frame) override;

    void release();

    [[nodiscard]] int width() const;
    [[nodiscard]] int height() const;

private:
    cv::VideoCapture capture_;
    cv::Mat raw_;
    bool mirror_ = true;
};

} // namespace core
