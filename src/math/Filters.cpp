#include "math/Filters.hpp"

namespace math {

MovingAverageFilter::MovingAverageFilter(size_t window)
    : _buffer(window == 0 ? 1 : window, 0.0f) {
    reset();
}

float MovingAverageFilter::filter(float value) {
    _buffer[_head] = value;
    _head = (_head + 1) % _buffer.size();
    if (_count < _buffer.size()) {
        _count++;
    }
    return mean();
}

float MovingAverageFilter::mean() const {
    if (_count == 0) return 0.0f;

    // Oldest sample sits at _head once the window is full, else at 0
    size_t start = (_count == _buffer.size()) ? _head : 0;
    double sum = 0.0;
    for (size_t i = 0; i < _count; ++i) {
        sum += _buffer[(start + i) % _buffer.size()];
    }
    return static_cast<float>(sum / static_cast<double>(_count));
}

void MovingAverageFilter::reset() {
    _head = 0;
    _count = 0;
}

} // namespace math
