#include "core/Logger.hpp"

namespace core {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

} // namespace core
