#pragma once

#include "Types.hpp"
#include "math/Filters.hpp"
#include <array>

namespace core {

/**
 * One moving-average window per metric key.
 */
class Smoother {
public:
    explicit Smoother(size_t window = DEFAULT_SMOOTHING_WINDOW);

    /**
     * Push value into the key's window and return the window mean.
     */
    float smooth(const MetricKey& key, float value);

    [[nodiscard]] size_t window() const { return window_; }
    [[nodiscard]] size_t samples(const MetricKey& key) const { return filters_[key.index()].size(); }

    void reset();

private:
    size_t window_;
    std::array<math::MovingAverageFilter, KEY_COUNT> filters_;
};

} // namespace core
