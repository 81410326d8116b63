#pragma once

#include <string>

namespace asymunc {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Global verbosity threshold, Warn by default.
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes one timestamped line to stderr when level passes the threshold.
void log_message(LogLevel level, const std::string& message);

}  // namespace asymunc
