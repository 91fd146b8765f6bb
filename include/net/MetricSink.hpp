#pragma once

#include "core/Types.hpp"

namespace net {

/**
 * Destination for the per-hand metric vector.
 * Implementations address the vector by hand ("/hand/left", "/hand/right").
 */
class MetricSink {
public:
    virtual ~MetricSink() = default;

    /**
     * @return false if the vector could not be delivered
     */
    virtual bool send(core::Hand hand, const core::MetricVector& values) = 0;
};

} // namespace net
