#include "core/CaptureSource.hpp"
#include "core/Logger.hpp"
#include <opencv2/core.hpp>

namespace core {

CaptureSource::~CaptureSource() {
    release();
}

bool CaptureSource::open(int deviceIndex, bool mirror) {
    mirror_ = mirror;
    if (!capture_.open(deviceIndex)) {
        Logger::error("Cannot open camera ", deviceIndex);
        return false;
    }
    Logger::info("Camera opened successfully (", width(), "x", height(), ")");
    return true;
}

bool CaptureSource::read(cv::Mat& frame) {
    if (!capture_.read(raw_) || raw_.empty()) {
        return false;
    }
    if (mirror_) {
        cv::flip(raw_, frame, 1);
    } else {
        raw_.copyTo(frame);
    }
    return true;
}

void CaptureSource::release() {
    if (capture_.isOpened()) {
        capture_.release();
        Logger::info("Camera released.");
    }
}

int CaptureSource::width() const {
    return static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
}

int CaptureSource::height() const {
    return static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
}

} // namespace core
