/*
 * Resolution.cpp
 *
 *  Created on: 5 jan. 2026
 */

#include "Resolution.hpp"

#include <stdint.h>

#include "utils/splitString.hpp"

static const Resolution ladder[] = {
    Resolution::Raw,         Resolution::OneMinute, Resolution::FiveMinutes,
    Resolution::FifteenMinutes, Resolution::OneHour, Resolution::SixHours,
    Resolution::OneDay,
};

const char *resolutionName(Resolution resolution) {
  switch (resolution) {
  case Resolution::Auto:
    return "auto";
  case Resolution::Raw:
    return "raw";
  case Resolution::OneMinute:
    return "1m";
  case Resolution::FiveMinutes:
    return "5m";
  case Resolution::FifteenMinutes:
    return "15m";
  case Resolution::OneHour:
    return "1h";
  case Resolution::SixHours:
    return "6h";
  case Resolution::OneDay:
    return "1d";
  }
  return "unknown";
}

bool parseResolution(const std::string &name, Resolution &resolution) {
  std::string lower = toLower(name);
  if (lower == "auto") {
    resolution = Resolution::Auto;
    return true;
  }
  for (auto rung : ladder) {
    if (lower == resolutionName(rung)) {
      resolution = rung;
      return true;
    }
  }
  return false;
}

int64_t bucketSeconds(Resolution resolution) {
  switch (resolution) {
  case Resolution::Auto:
    return 0;
  case Resolution::Raw:
    return 1;
  case Resolution::OneMinute:
    return 60;
  case Resolution::FiveMinutes:
    return 5 * 60;
  case Resolution::FifteenMinutes:
    return 15 * 60;
  case Resolution::OneHour:
    return 60 * 60;
  case Resolution::SixHours:
    return 6 * 60 * 60;
  case Resolution::OneDay:
    return 24 * 60 * 60;
  }
  return 0;
}

int64_t bucketStart(int64_t timestamp, int64_t width) {
  int64_t remainder = timestamp % width;
  if (remainder < 0)
    remainder += width;
  // The first bucket starts before INT64_MIN, clamp it
  if (timestamp < INT64_MIN + remainder)
    return INT64_MIN;
  return timestamp - remainder;
}

// Saturates at INT64_MAX for ranges wider than int64_t can count
int64_t bucketCount(int64_t start, int64_t end, int64_t width) {
  if (end < start || width <= 0)
    return 0;
  uint64_t span =
      (uint64_t)bucketStart(end, width) - (uint64_t)bucketStart(start, width);
  uint64_t buckets = span / (uint64_t)width;
  if (buckets >= (uint64_t)INT64_MAX)
    return INT64_MAX;
  return (int64_t)buckets + 1;
}

Resolution selectResolution(int64_t start, int64_t end, Resolution requested,
                            size_t budget) {
  if (requested != Resolution::Auto)
    return requested;

  for (auto rung : ladder) {
    if ((uint64_t)bucketCount(start, end, bucketSeconds(rung)) <= budget)
      return rung;
  }
  return Resolution::OneDay;
}
