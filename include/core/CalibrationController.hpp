#pragma once

#include "Types.hpp"

namespace core {

class RangeTracker;

/**
 * Discrete commands from the user input surface.
 */
enum class Command {
    Quit,
    LockMinLeft,
    LockMaxLeft,
    LockMinRight,
    LockMaxRight,
    ClearCalibration    // Both hands
};

enum class CalibrationStatus {
    Unlocked,
    MinLocked,
    MaxLocked,
    BothLocked
};

/**
 * Locks and clears the per-hand normalization bounds held by a RangeTracker.
 *
 * Locking copies the current global bounds of that hand's observed keys,
 * replacing any previous lock. Clearing drops both locks of a hand and leaves
 * the global ranges and smoothing windows untouched.
 */
class CalibrationController {
public:
    explicit CalibrationController(RangeTracker& ranges);

    void lockMin(Hand hand);
    void lockMax(Hand hand);
    void clear(Hand hand);

    /**
     * Execute a calibration command.
     * @return false for commands that are not calibration commands (Quit)
     */
    bool apply(Command command);

    [[nodiscard]] CalibrationStatus status(Hand hand) const;

    [[nodiscard]] static const char* getStatusName(CalibrationStatus status);

private:
    RangeTracker& ranges_;
};

} // namespace core
