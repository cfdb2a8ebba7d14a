// SPDX-License-Identifier: MIT

#include "logger.hpp"

#include "time.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace utils::logger {

static std::mutex log_mutex;
static std::string log_path = "ruuvi_daemon.log";
static FILE *logfile = nullptr;
static bool logfile_failed = false;
static std::atomic<bool> debug_logging{false};

// Strip the directory part, the sources live in a handful of directories
static const char *short_name(const char *file) {
    const char *slash = strrchr(file, '/');
    return slash ? slash + 1 : file;
}

const char *get_label(LogLevel level) {
    switch (level) {
    case LogLevel::Warning:
        return "[WARNING] ";
    case LogLevel::Error:
        return "[ERROR]   ";
    case LogLevel::DebugLog:
        return "[DEBUG]   ";
    default:
        return "[LOG]     ";
    }
}

void set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (logfile) {
        fclose(logfile);
        logfile = nullptr;
    }
    log_path = path;
    logfile_failed = false;
}

void set_debug(bool enabled) { debug_logging = enabled; }

bool debug_enabled(void) { return debug_logging; }

void log_impl2(LogLevel level, const char *file, int line, std::string_view msg) {
    std::string timestamp = getTimeString();
    std::lock_guard<std::mutex> lock(log_mutex);

    printf("%s %s%20s:%-4d %.*s\n", timestamp.c_str(), get_label(level), short_name(file), line,
           (int)msg.size(), msg.data());

    if (!logfile && !logfile_failed && !log_path.empty()) {
        logfile = fopen(log_path.c_str(), "a");
        if (!logfile) {
            logfile_failed = true;
            fprintf(stderr, "Cannot open log file %s: %s\n", log_path.c_str(), strerror(errno));
        }
    }
    if (logfile) {
        fprintf(logfile, "%s %s%20s:%-4d %.*s\n", timestamp.c_str(), get_label(level), short_name(file),
                line, (int)msg.size(), msg.data());
        fflush(logfile);
    }
}
} // namespace utils::logger
