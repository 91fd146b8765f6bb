#pragma once

#include "CalibrationController.hpp"
#include <optional>

namespace core {

/**
 * Keyboard mapping for the preview window:
 *   q        quit
 *   3 / 4    lock min / max of the left hand
 *   5 / 6    lock min / max of the right hand
 *   c        clear calibration of both hands
 *
 * @param key Raw key code as returned by cv::waitKey (-1 = no key)
 */
[[nodiscard]] std::optional<Command> commandForKey(int key);

} // namespace core
