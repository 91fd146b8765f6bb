#pragma once

#include "Types.hpp"

namespace core {

/**
 * Derives the 7 scalar hand-shape metrics from one hand's skeleton.
 *
 * Distances are measured in pixel space: the x-delta is scaled by the frame
 * width and the y-delta by the frame height, so values depend on the capture
 * resolution.
 */
class MetricExtractor {
public:
    /**
     * Landmark indices used by the metrics
     * Based on MediaPipe Hand Landmark model
     */
    struct LandmarkIndices {
        static constexpr int WRIST = 0;
        static constexpr int THUMB_TIP = 4;

        static constexpr int INDEX_MCP = 5;
        static constexpr int INDEX_TIP = 8;

        static constexpr int MIDDLE_MCP = 9;
        static constexpr int MIDDLE_TIP = 12;

        static constexpr int RING_MCP = 13;
        static constexpr int RING_TIP = 16;

        static constexpr int PINKY_MCP = 17;
        static constexpr int PINKY_TIP = 20;
    };

    MetricExtractor(int frameWidth, int frameHeight);

    /**
     * Compute all metrics in canonical order (see MetricName).
     */
    [[nodiscard]] MetricValues extract(const Landmarks& landmarks) const;

    /**
     * Pixel-space distance between two normalized landmarks.
     */
    [[nodiscard]] float distance(const Landmark& a, const Landmark& b) const;

private:
    int frameWidth_;
    int frameHeight_;
};

} // namespace core
