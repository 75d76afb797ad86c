// ==============================================================================
// Logger - Implementation
// ==============================================================================

#include "logger.hpp"
#include <cstdio>
#include <mutex>

namespace dsm {

namespace {

LogLevel max_level = LogLevel::NOTICE;
std::mutex log_mutex;

}  // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    max_level = level;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return max_level;
}

bool log_enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    return static_cast<int>(level) <= static_cast<int>(max_level);
}

void log_message(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (static_cast<int>(level) > static_cast<int>(max_level)) {
        return;
    }

    fmt::print(stderr, "{:>8}: {}", log_level_to_string(level), message);
    if (message.empty() || message.back() != '\n') {
        fmt::print(stderr, "\n");
    }
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    if (name == "fatal")   { level = LogLevel::FATAL;   return true; }
    if (name == "error")   { level = LogLevel::ERROR;   return true; }
    if (name == "warning") { level = LogLevel::WARNING; return true; }
    if (name == "notice")  { level = LogLevel::NOTICE;  return true; }
    if (name == "info")    { level = LogLevel::INFO;    return true; }
    if (name == "debug")   { level = LogLevel::DEBUG;   return true; }
    return false;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::FATAL:   return "fatal";
        case LogLevel::ERROR:   return "error";
        case LogLevel::WARNING: return "warning";
        case LogLevel::NOTICE:  return "notice";
        case LogLevel::INFO:    return "info";
        case LogLevel::DEBUG:   return "debug";
        default:                return "unknown";
    }
}

}  // namespace dsm
