// ==============================================================================
// Logger
// ==============================================================================
// Leveled diagnostic output for the runtime and the mirror. Messages are
// formatted with fmt and written to stderr under a mutex; anything above the
// configured threshold is dropped before formatting.
// ==============================================================================

#ifndef DSMIRROR_COMMON_LOGGER_HPP
#define DSMIRROR_COMMON_LOGGER_HPP

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace dsm {

enum class LogLevel {
    FATAL,
    ERROR,
    WARNING,
    NOTICE,
    INFO,
    DEBUG
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

/**
 * @brief True if a message at this level would be written
 */
bool log_enabled(LogLevel level);

/**
 * @brief Write one already-formatted message
 */
void log_message(LogLevel level, std::string_view message);

/**
 * @brief Parse "debug", "info", ... into a level
 *
 * @return false if the name is not a level
 */
bool parse_log_level(const std::string& name, LogLevel& level);

const char* log_level_to_string(LogLevel level);

template<typename... Args>
void log_at(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!log_enabled(level)) {
        return;
    }
    log_message(level, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
    log_at(LogLevel::ERROR, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_warn(fmt::format_string<Args...> format, Args&&... args) {
    log_at(LogLevel::WARNING, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_notice(fmt::format_string<Args...> format, Args&&... args) {
    log_at(LogLevel::NOTICE, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
    log_at(LogLevel::INFO, format, std::forward<Args>(args)...);
}

template<typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
    log_at(LogLevel::DEBUG, format, std::forward<Args>(args)...);
}

}  // namespace dsm

#endif  // DSMIRROR_COMMON_LOGGER_HPP
