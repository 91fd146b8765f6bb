#pragma once

#include "Types.hpp"
#include "EngineState.hpp"
#include "Normalizer.hpp"
#include <cstdint>

namespace net {
    class MetricSink;
}

namespace core {

/**
 * Runs the metric pipeline for one detected hand:
 * extract -> track range -> normalize -> smooth, per metric in canonical
 * order, then sends the 7-value vector to the sink addressed by hand.
 */
class FrameProcessor {
public:
    FrameProcessor(EngineState& state, net::MetricSink& sink);

    /**
     * Process one hand of the current frame.
     * @param hand Landmarks and optional handedness label
     * @param frameWidth Source frame width in pixels
     * @param frameHeight Source frame height in pixels
     * @return Smoothed values for the overlay
     */
    HandMetrics process(const HandFrame& hand, int frameWidth, int frameHeight);

    /**
     * Handedness label if present, else geometric fallback on the mirrored
     * frame: wrist left of the middle knuckle means Right.
     */
    [[nodiscard]] static Hand resolveHand(const HandFrame& hand);

    [[nodiscard]] uint64_t sendFailures() const { return sendFailures_; }

private:
    EngineState& state_;
    net::MetricSink& sink_;
    Normalizer normalizer_;

    uint64_t sendFailures_ = 0;
};

} // namespace core
