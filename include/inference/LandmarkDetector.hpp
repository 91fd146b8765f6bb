#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "core/Types.hpp"

namespace inference {

/**
 * Produces hand skeletons from an image.
 * Landmarks are normalized to the image size; the handedness label is left
 * empty when the detector is not confident.
 */
class LandmarkDetector {
public:
    virtual ~LandmarkDetector() = default;

    /**
     * @param bgrFrame Frame as delivered by the camera (already mirrored)
     * @return Zero or more hands
     */
    virtual std::vector<core::HandFrame> detect(const cv::Mat& bgrFrame) = 0;
};

} // namespace inference
