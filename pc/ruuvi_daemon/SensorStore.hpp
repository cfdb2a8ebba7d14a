/*
 * SensorStore.hpp
 *
 *  Created on: 5 jan. 2026
 */

#ifndef SENSORSTORE_HPP_
#define SENSORSTORE_HPP_

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include "Database.hpp"
#include "DeviceRegistry.hpp"
#include "Reading.hpp"
#include "Resolution.hpp"

enum class InsertResult {
  Inserted,
  Duplicate, // same (device, timestamp) already stored, row left unchanged
  InvalidReading,
  UnknownDevice,
  StorageBusy, // retry the whole insert
  StorageError,
};

enum class QueryStatus {
  Ok,
  InvalidRange,
  UnknownDevice,
  StorageError,
};

const char *insertResultName(InsertResult result);
const char *queryStatusName(QueryStatus status);

struct QueryRequest {
  int64_t start = 0;
  int64_t end = 0;     // inclusive
  std::string device_id; // empty: every known device
  Resolution resolution = Resolution::Auto;
  size_t limit = 0; // raw points per device, 0 is unlimited
};

struct FieldAggregate {
  double mean = 0;
  int64_t count = 0;
};

struct Bucket {
  int64_t start = 0;
  int64_t width = 0;
  int64_t count = 0; // raw points in the bucket
  std::array<std::optional<FieldAggregate>, kFieldCount> fields = {};

  const std::optional<FieldAggregate> &get(Field field) const {
    return fields[static_cast<size_t>(field)];
  }
};

// One device. Raw resolution fills points, every other resolution buckets.
struct Series {
  std::string device_id;
  Resolution resolution = Resolution::Raw;
  std::vector<Reading> points;
  std::vector<Bucket> buckets;

  size_t size(void) const {
    return resolution == Resolution::Raw ? points.size() : buckets.size();
  }
};

struct FieldSummary {
  double min = 0;
  double max = 0;
  double mean = 0;
  int64_t count = 0;
};

struct Summary {
  std::string device_id;
  int64_t count = 0;
  int64_t first = 0;
  int64_t last = 0;
  std::array<std::optional<FieldSummary>, kFieldCount> fields = {};

  const std::optional<FieldSummary> &get(Field field) const {
    return fields[static_cast<size_t>(field)];
  }
};

struct Gap {
  int64_t start = 0; // last point before the gap
  int64_t end = 0;   // first point after it
};

class SensorStore {
public:
  SensorStore(Database &db, DeviceRegistry &registry,
              size_t point_budget = kDefaultPointBudget);
  virtual ~SensorStore();

  bool isReady(void) const { return mReady; }
  size_t pointBudget(void) const { return mPointBudget; }

  // device_id is the id returned by the registry for this reading
  InsertResult insert(const Reading &reading, const std::string &device_id);

  QueryStatus query(const QueryRequest &request, std::vector<Series> &series);

  bool getLatest(const std::string &device_id, Reading &reading);
  QueryStatus count(int64_t start, int64_t end, const std::string &device_id,
                    int64_t &count);
  // Oldest and newest stored timestamp, false when the store is empty
  bool getDataRange(int64_t &first, int64_t &last);
  QueryStatus summarize(int64_t start, int64_t end,
                        const std::string &device_id, Summary &summary);
  QueryStatus findGaps(int64_t start, int64_t end,
                       const std::string &device_id, int64_t threshold,
                       std::vector<Gap> &gaps);

private:
  Database &mDb;
  DeviceRegistry &mRegistry;
  size_t mPointBudget;
  bool mReady = false;

  std::string mInsertSql;
  std::string mSelectSql;
  std::string mBucketSql;
  std::string mSummarySql;

  QueryStatus checkDevice(const std::string &device_id, std::string &mac);
  QueryStatus queryRaw(const std::string &device_id, int64_t start, int64_t end,
                       size_t limit, Series &series);
  QueryStatus queryBuckets(const std::string &device_id, int64_t start,
                           int64_t end, int64_t width, Series &series);
};

#endif /* SENSORSTORE_HPP_ */
