#include "core/Normalizer.hpp"
#include "core/RangeTracker.hpp"
#include <algorithm>

namespace core {

Normalizer::Normalizer(const RangeTracker& ranges)
    : ranges_(ranges) {
}

float Normalizer::normalize(const MetricKey& key, float value) const {
    return normalize(value, ranges_.effectiveRange(key));
}

float Normalizer::normalize(float value, const Range& range) {
    double span = static_cast<double>(range.max) - range.min;
    if (span < DEGENERATE_RANGE_EPSILON) {
        return 0.0f;
    }
    double t = (static_cast<double>(value) - range.min) / span;
    return static_cast<float>(std::clamp(t, 0.0, 1.0));
}

} // namespace core
