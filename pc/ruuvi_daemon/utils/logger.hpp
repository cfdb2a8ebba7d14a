// SPDX-License-Identifier: MIT

#ifndef UTILS_LOGGER_HPP_
#define UTILS_LOGGER_HPP_

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace utils::logger {

enum class LogLevel {
    Info,
    Warning,
    Error,
    DebugLog,
};

const char *get_label(LogLevel level);

void log_impl2(LogLevel level, const char *file, int line, std::string_view msg);

// Empty path disables the log file, stdout is always written
void set_log_file(const std::string &path);
void set_debug(bool enabled);
bool debug_enabled(void);

template <typename... Args>
void log_impl(LogLevel level, const char *file, int line, const char *fmt, Args... args) {
    if (level == LogLevel::DebugLog && !debug_enabled())
        return;

    int size = snprintf(nullptr, 0, fmt, args...);
    if (size < 0) {
        log_impl2(LogLevel::Error, file, line, "log format error");
        return;
    }
    std::vector<char> buffer(size + 1);
    snprintf(buffer.data(), buffer.size(), fmt, args...);
    log_impl2(level, file, line, std::string_view(buffer.data(), size));
}

inline void log_impl(LogLevel level, const char *file, int line, const char *msg) {
    if (level == LogLevel::DebugLog && !debug_enabled())
        return;
    log_impl2(level, file, line, msg);
}

} // namespace utils::logger

#define LOG_INFO(...) utils::logger::log_impl(utils::logger::LogLevel::Info, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARNING(...) utils::logger::log_impl(utils::logger::LogLevel::Warning, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) utils::logger::log_impl(utils::logger::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_DEBUG(...) utils::logger::log_impl(utils::logger::LogLevel::DebugLog, __FILE__, __LINE__, __VA_ARGS__)

#endif /* UTILS_LOGGER_HPP_ */
