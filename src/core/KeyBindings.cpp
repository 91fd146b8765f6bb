#include "core/KeyBindings.hpp"

namespace core {

std::optional<Command> commandForKey(int key) {
    if (key < 0) return std::nullopt;

    switch (key & 0xFF) {
        case 'q': return Command::Quit;
        case '3': return Command::LockMinLeft;
        case '4': return Command::LockMaxLeft;
        case '5': return Command::LockMinRight;
        case '6': return Command::LockMaxRight;
        case 'c': return Command::ClearCalibration;
        default:  return std::nullopt;
    }
}

} // namespace core
