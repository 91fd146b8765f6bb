#include "core/MetricExtractor.hpp"
#include <cmath>

namespace core {

namespace {

using LM = MetricExtractor::LandmarkIndices;

constexpr std::array<int, 4> FINGER_TIPS = {LM::INDEX_TIP, LM::MIDDLE_TIP, LM::RING_TIP, LM::PINKY_TIP};
constexpr std::array<int, 4> FINGER_MCPS = {LM::INDEX_MCP, LM::MIDDLE_MCP, LM::RING_MCP, LM::PINKY_MCP};

} // namespace

MetricExtractor::MetricExtractor(int frameWidth, int frameHeight)
    : frameWidth_(frameWidth), frameHeight_(frameHeight) {
}

float MetricExtractor::distance(const Landmark& a, const Landmark& b) const {
    double dx = (static_cast<double>(a.x) - b.x) * frameWidth_;
    double dy = (static_cast<double>(a.y) - b.y) * frameHeight_;
    return static_cast<float>(std::sqrt(dx * dx + dy * dy));
}

MetricValues MetricExtractor::extract(const Landmarks& landmarks) const {
    MetricValues values{};
    const Landmark& wrist = landmarks[LM::WRIST];

    // Fingertip -> matching knuckle (thumb excluded)
    for (size_t i = 0; i < FINGER_TIPS.size(); ++i) {
        values[i] = distance(landmarks[FINGER_TIPS[i]], landmarks[FINGER_MCPS[i]]);
    }

    values[static_cast<size_t>(MetricName::ThumbToIndexMcp)] =
        distance(landmarks[LM::THUMB_TIP], landmarks[LM::INDEX_MCP]);

    float tipToWrist = 0.0f;
    for (int tip : FINGER_TIPS) {
        tipToWrist += distance(landmarks[tip], wrist);
    }
    values[static_cast<size_t>(MetricName::AvgTipToWrist)] = tipToWrist / FINGER_TIPS.size();

    // Mean over the 6 knuckle pairs
    float mcpSpread = 0.0f;
    int pairs = 0;
    for (size_t i = 0; i < FINGER_MCPS.size(); ++i) {
        for (size_t j = i + 1; j < FINGER_MCPS.size(); ++j) {
            mcpSpread += distance(landmarks[FINGER_MCPS[i]], landmarks[FINGER_MCPS[j]]);
            ++pairs;
        }
    }
    values[static_cast<size_t>(MetricName::McpToMcp)] = mcpSpread / pairs;

    return values;
}

} // namespace core
