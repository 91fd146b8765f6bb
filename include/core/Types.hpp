#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace core {

// ============================================================
// Constants - Hand Metric Pipeline Configuration
// ============================================================

// MediaPipe hand topology
constexpr size_t LANDMARK_COUNT = 21;

// 7 metrics per hand, 2 hands
constexpr size_t METRIC_COUNT = 7;
constexpr size_t HAND_COUNT = 2;
constexpr size_t KEY_COUNT = METRIC_COUNT * HAND_COUNT;

// Smoothing
constexpr size_t DEFAULT_SMOOTHING_WINDOW = 5;
constexpr size_t MAX_SMOOTHING_WINDOW = 64;

// Ranges narrower than this normalize to 0
constexpr double DEGENERATE_RANGE_EPSILON = 1e-9;

// Default effective range when nothing has been tracked yet
constexpr float DEFAULT_RANGE_MIN = 0.0f;
constexpr float DEFAULT_RANGE_MAX = 1.0f;

// OSC Configuration
constexpr const char* DEFAULT_OSC_HOST = "127.0.0.1";
constexpr const char* DEFAULT_OSC_PORT = "57120";

// ============================================================
// Data Structures
// ============================================================

enum class Hand {
    Left = 0,
    Right = 1
};

// Canonical metric order. This is also the OSC argument order.
enum class MetricName {
    TipToMcp0 = 0,      // Index tip -> index MCP
    TipToMcp1 = 1,      // Middle tip -> middle MCP
    TipToMcp2 = 2,      // Ring tip -> ring MCP
    TipToMcp3 = 3,      // Pinky tip -> pinky MCP
    ThumbToIndexMcp = 4,
    AvgTipToWrist = 5,
    McpToMcp = 6
};

constexpr std::array<Hand, HAND_COUNT> ALL_HANDS = {Hand::Left, Hand::Right};

constexpr std::array<MetricName, METRIC_COUNT> ALL_METRICS = {
    MetricName::TipToMcp0,
    MetricName::TipToMcp1,
    MetricName::TipToMcp2,
    MetricName::TipToMcp3,
    MetricName::ThumbToIndexMcp,
    MetricName::AvgTipToWrist,
    MetricName::McpToMcp
};

/**
 * Typed (hand, metric) pair. Every piece of per-key state is stored in
 * dense arrays addressed by index(), so a key of one hand can never alias
 * a key of the other.
 */
struct MetricKey {
    Hand hand = Hand::Left;
    MetricName metric = MetricName::TipToMcp0;

    [[nodiscard]] constexpr size_t index() const {
        return static_cast<size_t>(hand) * METRIC_COUNT + static_cast<size_t>(metric);
    }

    constexpr bool operator==(const MetricKey& other) const {
        return hand == other.hand && metric == other.metric;
    }
    constexpr bool operator!=(const MetricKey& other) const { return !(*this == other); }
};

constexpr size_t handIndex(Hand hand) { return static_cast<size_t>(hand); }

[[nodiscard]] const char* handName(Hand hand);
[[nodiscard]] const char* metricName(MetricName metric);

// "Left_tip_to_mcp_0" etc. Display only, never used for lookup.
[[nodiscard]] std::string keyName(const MetricKey& key);

// "/hand/left" or "/hand/right"
[[nodiscard]] const char* oscAddress(Hand hand);

// 2D landmark in normalized image coordinates [0,1] x [0,1]
struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
};

using Landmarks = std::array<Landmark, LANDMARK_COUNT>;

/**
 * One detected hand for one frame.
 * label is empty when the detector could not classify handedness.
 */
struct HandFrame {
    Landmarks landmarks{};
    std::optional<Hand> label;
};

// Raw metric values in canonical order
using MetricValues = std::array<float, METRIC_COUNT>;

// Smoothed, normalized values in canonical order, each in [0,1]
using MetricVector = std::array<float, METRIC_COUNT>;

// Effective normalization range of a key
struct Range {
    float min = DEFAULT_RANGE_MIN;
    float max = DEFAULT_RANGE_MAX;
};

/**
 * Result of processing one hand, handed to the overlay.
 */
struct HandMetrics {
    Hand hand = Hand::Left;
    Landmarks landmarks{};
    MetricVector values{};

    // (name, value) pairs in canonical order
    [[nodiscard]] std::vector<std::pair<std::string, float>> named() const;
};

} // namespace core
