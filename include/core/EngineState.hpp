#pragma once

#include "RangeTracker.hpp"
#include "Smoother.hpp"

namespace core {

/**
 * All mutable pipeline state for one process run.
 * Constructed once at startup and passed by reference to the components.
 */
struct EngineState {
    explicit EngineState(size_t smoothingWindow = DEFAULT_SMOOTHING_WINDOW)
        : smoother(smoothingWindow) {}

    RangeTracker ranges;
    Smoother smoother;
};

} // namespace core
