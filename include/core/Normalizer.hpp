#pragma once

#include "Types.hpp"

namespace core {

class RangeTracker;

/**
 * Maps raw metric values into [0, 1] using the effective range of the key.
 */
class Normalizer {
public:
    explicit Normalizer(const RangeTracker& ranges);

    [[nodiscard]] float normalize(const MetricKey& key, float value) const;

    /**
     * Clamp (value - min) / (max - min) to [0, 1].
     * Returns 0 when the range is narrower than DEGENERATE_RANGE_EPSILON.
     */
    [[nodiscard]] static float normalize(float value, const Range& range);

private:
    const RangeTracker& ranges_;
};

} // namespace core
