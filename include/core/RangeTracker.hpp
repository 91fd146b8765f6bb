#pragma once

#include "Types.hpp"
#include <array>
#include <optional>

namespace core {

/**
 * Per-hand locked boundaries. A slot is set only for keys that had been
 * observed when the lock was taken.
 */
struct LockedBounds {
    std::array<std::optional<float>, METRIC_COUNT> values{};

    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t count() const;
    void clear() { values.fill(std::nullopt); }
};

/**
 * All range state of the pipeline: running global min/max per key plus the
 * locked min/max overrides of each hand.
 */
struct RangeState {
    std::array<std::optional<float>, KEY_COUNT> globalMin{};
    std::array<std::optional<float>, KEY_COUNT> globalMax{};

    std::array<LockedBounds, HAND_COUNT> lockedMin{};
    std::array<LockedBounds, HAND_COUNT> lockedMax{};
};

/**
 * Tracks the running range of every metric key.
 *
 * The global range of a key only widens. Once the max of a hand is locked,
 * tracking stops for the locked keys of that hand until the lock is cleared;
 * a min lock alone does not stop tracking.
 */
class RangeTracker {
public:
    RangeTracker() = default;

    /**
     * Widen the global range of key to include value.
     * No-op while the key's max is locked.
     */
    void update(const MetricKey& key, float value);

    /**
     * Range used for normalization: locked bound, else global bound,
     * else the default [0, 1].
     */
    [[nodiscard]] Range effectiveRange(const MetricKey& key) const;

    [[nodiscard]] std::optional<float> globalMin(const MetricKey& key) const {
        return state_.globalMin[key.index()];
    }
    [[nodiscard]] std::optional<float> globalMax(const MetricKey& key) const {
        return state_.globalMax[key.index()];
    }

    [[nodiscard]] bool isMaxLocked(const MetricKey& key) const;

    [[nodiscard]] const RangeState& state() const { return state_; }
    RangeState& state() { return state_; }

private:
    RangeState state_;
};

} // namespace core
