#pragma once

#include <cstddef>
#include <vector>

namespace math {

/**
 * Simple moving average over a hard window.
 *
 * Samples are kept in a ring buffer allocated once at construction; when the
 * window is full the oldest sample is overwritten. No decay constant, every
 * sample in the window has equal weight.
 */
class MovingAverageFilter {
public:
    explicit MovingAverageFilter(size_t window = 5);

    /**
     * Add a sample and return the mean of the samples currently in the window.
     */
    float filter(float value);

    void reset();

    [[nodiscard]] size_t window() const { return _buffer.size(); }
    [[nodiscard]] size_t size() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }
    [[nodiscard]] float mean() const;

private:
    std::vector<float> _buffer;
    size_t _head = 0;   // Next write position
    size_t _count = 0;  // Valid samples, <= window
};

} // namespace math
