#pragma once

#include <string>

namespace specsel {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    OFF
};

/// Lines below this level are dropped. Default: INFO.
void setLogLevel(LogLevel level);
LogLevel logLevel();

/// Parse "debug", "info", "warn", "error" or "off" (case-sensitive).
/// Returns false and leaves `out` alone on an unknown name.
bool parseLogLevel(const std::string& name, LogLevel& out);

// Each line is "[YYYY-mm-dd HH:MM:SS][LEVEL] msg". ERROR goes to stderr,
// everything else to stdout. Safe to call from concurrent runs.
void logDebug(const std::string& msg);
void logInfo(const std::string& msg);
void logWarn(const std::string& msg);
void logError(const std::string& msg);

} // namespace specsel
