#include "core/Types.hpp"

namespace core {

const char* handName(Hand hand) {
    switch (hand) {
        case Hand::Left:  return "Left";
        case Hand::Right: return "Right";
    }
    return "Left";
}

const char* metricName(MetricName metric) {
    switch (metric) {
        case MetricName::TipToMcp0:       return "tip_to_mcp_0";
        case MetricName::TipToMcp1:       return "tip_to_mcp_1";
        case MetricName::TipToMcp2:       return "tip_to_mcp_2";
        case MetricName::TipToMcp3:       return "tip_to_mcp_3";
        case MetricName::ThumbToIndexMcp: return "thumb_to_index_mcp";
        case MetricName::AvgTipToWrist:   return "avg_tip_to_wrist";
        case MetricName::McpToMcp:        return "mcp_to_mcp";
    }
    return "unknown";
}

std::string keyName(const MetricKey& key) {
    return std::string(handName(key.hand)) + "_" + metricName(key.metric);
}

const char* oscAddress(Hand hand) {
    return hand == Hand::Left ? "/hand/left" : "/hand/right";
}

std::vector<std::pair<std::string, float>> HandMetrics::named() const {
    std::vector<std::pair<std::string, float>> out;
    out.reserve(METRIC_COUNT);
    for (MetricName metric : ALL_METRICS) {
        out.emplace_back(keyName({hand, metric}), values[static_cast<size_t>(metric)]);
    }
    return out;
}

} // namespace core
