#include "core/FrameProcessor.hpp"
#include "core/MetricExtractor.hpp"
#include "core/Logger.hpp"
#include "net/MetricSink.hpp"

namespace core {

FrameProcessor::FrameProcessor(EngineState& state, net::MetricSink& sink)
    : state_(state), sink_(sink), normalizer_(state.ranges) {
}

Hand FrameProcessor::resolveHand(const HandFrame& hand) {
    if (hand.label) {
        return *hand.label;
    }
    const auto& wrist = hand.landmarks[MetricExtractor::LandmarkIndices::WRIST];
    const auto& middleMcp = hand.landmarks[MetricExtractor::LandmarkIndices::MIDDLE_MCP];
    return wrist.x < middleMcp.x ? Hand::Right : Hand::Left;
}

HandMetrics FrameProcessor::process(const HandFrame& hand, int frameWidth, int frameHeight) {
    HandMetrics result;
    result.hand = resolveHand(hand);
    result.landmarks = hand.landmarks;

    MetricExtractor extractor(frameWidth, frameHeight);
    const MetricValues raw = extractor.extract(hand.landmarks);

    for (MetricName metric : ALL_METRICS) {
        const MetricKey key{result.hand, metric};
        const size_t i = static_cast<size_t>(metric);

        state_.ranges.update(key, raw[i]);
        float normalized = normalizer_.normalize(key, raw[i]);
        result.values[i] = state_.smoother.smooth(key, normalized);

        if (Logger::enabled(LogLevel::DEBUG)) {
            Logger::debug(keyName(key), ": raw=", raw[i], " norm=", normalized, " smooth=", result.values[i]);
        }
    }

    if (!sink_.send(result.hand, result.values)) {
        // Log the first failure and then every 300th
        if (sendFailures_++ % 300 == 0) {
            Logger::warn("FrameProcessor: Failed to send ", oscAddress(result.hand),
                         " (", sendFailures_, " failures)");
        }
    }

    return result;
}

} // namespace core
