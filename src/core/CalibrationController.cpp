#include "core/CalibrationController.hpp"
#include "core/RangeTracker.hpp"
#include "core/Logger.hpp"

namespace core {

CalibrationController::CalibrationController(RangeTracker& ranges)
    : ranges_(ranges) {
}

void CalibrationController::lockMin(Hand hand) {
    auto& state = ranges_.state();
    auto& locked = state.lockedMin[handIndex(hand)];

    locked.clear();
    for (MetricName metric : ALL_METRICS) {
        locked.values[static_cast<size_t>(metric)] = state.globalMin[MetricKey{hand, metric}.index()];
    }

    Logger::info("Fixed MIN for ", handName(hand), ": ", locked.count(), " metrics locked.");
}

void CalibrationController::lockMax(Hand hand) {
    auto& state = ranges_.state();
    auto& locked = state.lockedMax[handIndex(hand)];

    locked.clear();
    for (MetricName metric : ALL_METRICS) {
        locked.values[static_cast<size_t>(metric)] = state.globalMax[MetricKey{hand, metric}.index()];
    }

    Logger::info("Fixed MAX for ", handName(hand), ": ", locked.count(), " metrics locked.");
}

void CalibrationController::clear(Hand hand) {
    auto& state = ranges_.state();
    state.lockedMin[handIndex(hand)].clear();
    state.lockedMax[handIndex(hand)].clear();

    Logger::info("Calibration cleared for ", handName(hand), " hand.");
}

bool CalibrationController::apply(Command command) {
    switch (command) {
        case Command::LockMinLeft:  lockMin(Hand::Left); return true;
        case Command::LockMaxLeft:  lockMax(Hand::Left); return true;
        case Command::LockMinRight: lockMin(Hand::Right); return true;
        case Command::LockMaxRight: lockMax(Hand::Right); return true;
        case Command::ClearCalibration:
            clear(Hand::Left);
            clear(Hand::Right);
            return true;
        case Command::Quit:
            return false;
    }
    return false;
}

CalibrationStatus CalibrationController::status(Hand hand) const {
    const auto& state = ranges_.state();
    bool minLocked = !state.lockedMin[handIndex(hand)].empty();
    bool maxLocked = !state.lockedMax[handIndex(hand)].empty();

    if (minLocked && maxLocked) return CalibrationStatus::BothLocked;
    if (minLocked) return CalibrationStatus::MinLocked;
    if (maxLocked) return CalibrationStatus::MaxLocked;
    return CalibrationStatus::Unlocked;
}

const char* CalibrationController::getStatusName(CalibrationStatus status) {
    switch (status) {
        case CalibrationStatus::Unlocked:   return "UNLOCKED";
        case CalibrationStatus::MinLocked:  return "MIN LOCKED";
        case CalibrationStatus::MaxLocked:  return "MAX LOCKED";
        case CalibrationStatus::BothLocked: return "LOCKED";
        default: return "UNLOCKED";
    }
}

} // namespace core
