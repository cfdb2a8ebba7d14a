// SPDX-License-Identifier: MIT

#include "time.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if __cpp_lib_chrono >= 201907L && __has_include(<format>)
// We have modern C++ chrono support, we can format time the C++ way
#include <chrono>
#include <format>

std::string getTimeString(void) {
    const auto zt{std::chrono::zoned_time{std::chrono::current_zone(), std::chrono::system_clock::now()}};
    return std::format("{:%FT%T%z}", zt);
}

#else
// Not having C++ chrono support for formatting time, but using a C99 library
std::string getTimeString(void) {
    char buff[64] = {};
    time_t current_time = time(nullptr);
    struct tm tm = {};
    localtime_r(&current_time, &tm);
    strftime(buff, sizeof(buff), "%FT%T%z", &tm);
    return buff;
}

#endif

int64_t getUnixTime(void) { return (int64_t)time(nullptr); }

bool parseIsoTime(const std::string &text, int64_t &seconds) {
    struct tm tm = {};
    int consumed = 0;
    int parsed = sscanf(text.c_str(), "%4d-%2d-%2d%*[T ]%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (parsed != 6)
        return false;
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 ||
        tm.tm_min > 59 || tm.tm_sec > 60)
        return false;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    const char *rest = text.c_str() + consumed;

    // Fractional seconds are dropped, storage has second resolution
    if (*rest == '.') {
        rest++;
        while (*rest >= '0' && *rest <= '9')
            rest++;
    }

    int offset = 0;
    if (*rest == 'Z' || *rest == 'z') {
        rest++;
    } else if (*rest == '+' || *rest == '-') {
        int sign = (*rest == '-') ? -1 : 1;
        int hours = 0, minutes = 0;
        rest++;
        if (sscanf(rest, "%2d:%2d", &hours, &minutes) == 2) {
            rest += 5;
        } else if (sscanf(rest, "%2d%2d", &hours, &minutes) == 2) {
            rest += 4;
        } else if (sscanf(rest, "%2d", &hours) == 1) {
            rest += 2;
        } else {
            return false;
        }
        offset = sign * (hours * 3600 + minutes * 60);
    }
    if (*rest != '\0')
        return false;

    seconds = (int64_t)timegm(&tm) - offset;
    return true;
}

std::string formatIsoTime(int64_t seconds) {
    char buff[32] = {};
    time_t t = (time_t)seconds;
    struct tm tm = {};
    gmtime_r(&t, &tm);
    strftime(buff, sizeof(buff), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buff;
}
