#include "core/RangeTracker.hpp"
#include <algorithm>

namespace core {

bool LockedBounds::empty() const {
    return count() == 0;
}

size_t LockedBounds::count() const {
    return static_cast<size_t>(std::count_if(values.begin(), values.end(),
        [](const std::optional<float>& v) { return v.has_value(); }));
}

bool RangeTracker::isMaxLocked(const MetricKey& key) const {
    const auto& locked = state_.lockedMax[handIndex(key.hand)];
    return locked.values[static_cast<size_t>(key.metric)].has_value();
}

void RangeTracker::update(const MetricKey& key, float value) {
    // Only a max lock gates tracking
    if (isMaxLocked(key)) return;

    auto& min = state_.globalMin[key.index()];
    auto& max = state_.globalMax[key.index()];

    if (!min || value < *min) {
        min = value;
    }
    if (!max || value > *max) {
        max = value;
    }
}

Range RangeTracker::effectiveRange(const MetricKey& key) const {
    const size_t hand = handIndex(key.hand);
    const size_t metric = static_cast<size_t>(key.metric);

    Range range;
    range.min = state_.lockedMin[hand].values[metric]
                    .value_or(state_.globalMin[key.index()].value_or(DEFAULT_RANGE_MIN));
    range.max = state_.lockedMax[hand].values[metric]
                    .value_or(state_.globalMax[key.index()].value_or(DEFAULT_RANGE_MAX));
    return range;
}

} // namespace core
