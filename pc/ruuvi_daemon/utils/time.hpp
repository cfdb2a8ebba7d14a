// SPDX-License-Identifier: MIT

#ifndef UTILS_TIME_HPP_
#define UTILS_TIME_HPP_

#include <cstdint>
#include <string>

// Local time with offset, for log lines
std::string getTimeString(void);

// Seconds since epoch
int64_t getUnixTime(void);

// Accepts 2025-12-31T17:00:00, with optional fraction and Z or +hh:mm / +hhmm
// offset. Without an offset the time is taken as UTC.
bool parseIsoTime(const std::string &text, int64_t &seconds);

// 2025-12-31T17:00:00Z
std::string formatIsoTime(int64_t seconds);

#endif /* UTILS_TIME_HPP_ */
