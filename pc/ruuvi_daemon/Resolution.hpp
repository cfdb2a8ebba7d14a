/*
 * Resolution.hpp
 *
 *  Created on: 5 jan. 2026
 */

#ifndef RESOLUTION_HPP_
#define RESOLUTION_HPP_

#include <string>

#include <stddef.h>
#include <stdint.h>

enum class Resolution {
  Auto,
  Raw,
  OneMinute,
  FiveMinutes,
  FifteenMinutes,
  OneHour,
  SixHours,
  OneDay,
};

constexpr size_t kDefaultPointBudget = 500;

const char *resolutionName(Resolution resolution);
bool parseResolution(const std::string &name, Resolution &resolution);

// Bucket width in seconds. Raw counts as one second, Auto has no width.
int64_t bucketSeconds(Resolution resolution);

// Rounds towards negative infinity, bucket edges stay aligned to the epoch
// for timestamps before 1970 as well
int64_t bucketStart(int64_t timestamp, int64_t width);

// Number of epoch aligned buckets touched by [start, end]
int64_t bucketCount(int64_t start, int64_t end, int64_t width);

/*
 * Explicit resolutions are returned unchanged. Auto walks the ladder
 * raw, 1m, 5m, 15m, 1h, 6h, 1d and takes the first width whose bucket count
 * over [start, end] fits the budget, falling back to 1d.
 */
Resolution selectResolution(int64_t start, int64_t end, Resolution requested,
                            size_t budget = kDefaultPointBudget);

#endif /* RESOLUTION_HPP_ */
