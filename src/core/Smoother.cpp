#include "core/Smoother.hpp"

namespace core {

Smoother::Smoother(size_t window)
    : window_(window == 0 ? 1 : window) {
    filters_.fill(math::MovingAverageFilter(window_));
}

float Smoother::smooth(const MetricKey& key, float value) {
    return filters_[key.index()].filter(value);
}

void Smoother::reset() {
    for (auto& filter : filters_) {
        filter.reset();
    }
}

} // namespace core
