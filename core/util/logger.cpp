#include "util/logger.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace specsel {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_write_mutex;

std::string timestampNow() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
#ifdef _WIN32
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

void logCommon(LogLevel level, const char* tag, const std::string& msg,
               std::ostream& os) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    os << "[" << timestampNow() << "][" << tag << "] " << msg << std::endl;
}

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    if (name == "off")   { out = LogLevel::OFF;   return true; }
    return false;
}

void logDebug(const std::string& msg) { logCommon(LogLevel::DEBUG, "DEBUG", msg, std::cout); }
void logInfo(const std::string& msg)  { logCommon(LogLevel::INFO,  "INFO",  msg, std::cout); }
void logWarn(const std::string& msg)  { logCommon(LogLevel::WARN,  "WARN",  msg, std::cout); }
void logError(const std::string& msg) { logCommon(LogLevel::ERROR, "ERROR", msg, std::cerr); }

} // namespace specsel
