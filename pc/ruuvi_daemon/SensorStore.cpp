/*
 * SensorStore.cpp
 *
 *  Created on: 5 jan. 2026
 */

#include "SensorStore.hpp"

#include "utils/logger.hpp"

static bool isBusy(int rc) { return (rc & 0xFF) == SQLITE_BUSY; }

// Columns 0..2 are device_id, timestamp, data_format, the fields follow
static const int kFirstFieldColumn = 3;

static bool rowToReading(Statement &stmt, Reading &reading) {
  reading = Reading();
  reading.device_id = stmt.columnText(0);
  reading.timestamp = stmt.columnInt(1);
  uint8_t code = (uint8_t)stmt.columnInt(2);
  if (!formatFromCode(code, reading.format)) {
    LOG_WARNING("Stored row %s@%lld has unknown format 0x%02X",
                reading.device_id.c_str(), (long long)reading.timestamp, code);
    return false;
  }
  reading.sensor_type = sensorTypeForFormat(reading.format);
  for (size_t i = 0; i < kFieldCount; i++)
    reading.values[i] = stmt.columnOptional(kFirstFieldColumn + (int)i);
  return true;
}

const char *insertResultName(InsertResult result) {
  switch (result) {
  case InsertResult::Inserted:
    return "inserted";
  case InsertResult::Duplicate:
    return "duplicate";
  case InsertResult::InvalidReading:
    return "invalid reading";
  case InsertResult::UnknownDevice:
    return "unknown device";
  case InsertResult::StorageBusy:
    return "storage busy";
  case InsertResult::StorageError:
    return "storage error";
  }
  return "unknown";
}

const char *queryStatusName(QueryStatus status) {
  switch (status) {
  case QueryStatus::Ok:
    return "ok";
  case QueryStatus::InvalidRange:
    return "invalid range";
  case QueryStatus::UnknownDevice:
    return "unknown device";
  case QueryStatus::StorageError:
    return "storage error";
  }
  return "unknown";
}

SensorStore::SensorStore(Database &db, DeviceRegistry &registry,
                         size_t point_budget)
    : mDb(db), mRegistry(registry), mPointBudget(point_budget) {
  if (!mPointBudget)
    mPointBudget = kDefaultPointBudget;

  std::string create = "CREATE TABLE IF NOT EXISTS readings ( "
                       "device_id TEXT NOT NULL REFERENCES devices(mac), "
                       "timestamp INTEGER NOT NULL, "
                       "data_format INTEGER NOT NULL, ";
  std::string columns = "device_id, timestamp, data_format";
  std::string placeholders = "?, ?, ?";
  std::string averages = "COUNT(*)";
  std::string summary = "COUNT(*), MIN(timestamp), MAX(timestamp)";
  for (auto &info : allFields()) {
    std::string name = info.name;
    create += name + (info.integer ? " INTEGER, " : " REAL, ");
    columns += ", " + name;
    placeholders += ", ?";
    averages += ", AVG(" + name + "), COUNT(" + name + ")";
    summary += ", MIN(" + name + "), MAX(" + name + "), AVG(" + name +
               "), COUNT(" + name + ")";
  }
  create += "PRIMARY KEY (device_id, timestamp) ); "
            "CREATE INDEX IF NOT EXISTS readings_timestamp "
            "ON readings (timestamp);";

  mInsertSql = "INSERT INTO readings (" + columns + ") VALUES (" +
               placeholders +
               ") ON CONFLICT (device_id, timestamp) DO NOTHING";
  mSelectSql = "SELECT " + columns +
               " FROM readings WHERE device_id = ?1 AND timestamp BETWEEN ?2 "
               "AND ?3 ";
  // ?1 width, floor division that stays aligned below zero
  mBucketSql = "SELECT timestamp - (((timestamp % ?1) + ?1) % ?1) AS bucket, " +
               averages +
               " FROM readings WHERE device_id = ?2 AND timestamp BETWEEN ?3 "
               "AND ?4 GROUP BY bucket ORDER BY bucket";
  mSummarySql = "SELECT " + summary +
                " FROM readings WHERE device_id = ?1 AND timestamp BETWEEN ?2 "
                "AND ?3";

  const std::lock_guard<std::mutex> lock(mDb.mutex());
  int rc = mDb.exec(create.c_str());
  if (rc != SQLITE_OK) {
    LOG_ERROR("Failed to create readings table: %s", mDb.errmsg());
  } else {
    mReady = true;
  }
}

SensorStore::~SensorStore() {}

InsertResult SensorStore::insert(const Reading &reading,
                                 const std::string &device_id) {
  if (device_id.empty()) {
    LOG_ERROR("Refusing reading without device id");
    return InsertResult::InvalidReading;
  }
  if (reading.sensor_type != sensorTypeForFormat(reading.format) ||
      !reading.isConsistent()) {
    LOG_ERROR("Refusing %s reading of %s with fields of another sensor type",
              formatName(reading.format), device_id.c_str());
    return InsertResult::InvalidReading;
  }

  const std::lock_guard<std::mutex> lock(mDb.mutex());
  Statement stmt(mDb, mInsertSql.c_str());
  if (!stmt.ok())
    return isBusy(stmt.prepareResult()) ? InsertResult::StorageBusy
                                        : InsertResult::StorageError;

  stmt.bind(1, device_id);
  stmt.bind(2, reading.timestamp);
  stmt.bind(3, (int64_t)reading.format);
  for (auto &info : allFields())
    stmt.bind(kFirstFieldColumn + 1 + (int)info.field, reading.get(info.field),
              info.integer);

  // One statement, sqlite wraps it in its own transaction
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    if (sqlite3_changes(mDb.handle()) == 0) {
      LOG_DEBUG("Duplicate %s@%lld from %s", device_id.c_str(),
                (long long)reading.timestamp, formatName(reading.format));
      return InsertResult::Duplicate;
    }
    return InsertResult::Inserted;
  }
  if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) {
    LOG_ERROR("Refusing reading for unregistered device %s", device_id.c_str());
    return InsertResult::UnknownDevice;
  }
  if (isBusy(rc)) {
    LOG_WARNING("Database busy while storing %s@%lld", device_id.c_str(),
                (long long)reading.timestamp);
    return InsertResult::StorageBusy;
  }
  LOG_ERROR("Failed to store %s@%lld: %s", device_id.c_str(),
            (long long)reading.timestamp, mDb.errmsg());
  return InsertResult::StorageError;
}

QueryStatus SensorStore::checkDevice(const std::string &device_id,
                                     std::string &mac) {
  Device device;
  if (!mRegistry.getDevice(device_id, device)) {
    LOG_ERROR("Unknown device %s", device_id.c_str());
    return QueryStatus::UnknownDevice;
  }
  mac = device.mac;
  return QueryStatus::Ok;
}

QueryStatus SensorStore::queryRaw(const std::string &device_id, int64_t start,
                                  int64_t end, size_t limit, Series &series) {
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  std::string sql = mSelectSql + "ORDER BY timestamp LIMIT ?4";
  Statement stmt(mDb, sql.c_str());
  if (!stmt.ok())
    return QueryStatus::StorageError;
  stmt.bind(1, device_id);
  stmt.bind(2, start);
  stmt.bind(3, end);
  // A negative limit is no limit
  stmt.bind(4, limit ? (int64_t)limit : (int64_t)-1);

  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Reading reading;
    if (rowToReading(stmt, reading))
      series.points.push_back(reading);
  }
  if (rc != SQLITE_DONE) {
    LOG_ERROR("Query for %s failed: %s", device_id.c_str(), mDb.errmsg());
    return QueryStatus::StorageError;
  }
  return QueryStatus::Ok;
}

QueryStatus SensorStore::queryBuckets(const std::string &device_id,
                                      int64_t start, int64_t end, int64_t width,
                                      Series &series) {
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  Statement stmt(mDb, mBucketSql.c_str());
  if (!stmt.ok())
    return QueryStatus::StorageError;
  stmt.bind(1, width);
  stmt.bind(2, device_id);
  stmt.bind(3, start);
  stmt.bind(4, end);

  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Bucket bucket;
    bucket.start = stmt.columnInt(0);
    bucket.width = width;
    bucket.count = stmt.columnInt(1);
    for (size_t i = 0; i < kFieldCount; i++) {
      int column = 2 + 2 * (int)i;
      int64_t contributing = stmt.columnInt(column + 1);
      if (!contributing)
        continue;
      FieldAggregate aggregate;
      aggregate.mean = stmt.columnDouble(column);
      aggregate.count = contributing;
      bucket.fields[i] = aggregate;
    }
    series.buckets.push_back(bucket);
  }
  if (rc != SQLITE_DONE) {
    LOG_ERROR("Aggregate query for %s failed: %s", device_id.c_str(),
              mDb.errmsg());
    return QueryStatus::StorageError;
  }
  return QueryStatus::Ok;
}

QueryStatus SensorStore::query(const QueryRequest &request,
                               std::vector<Series> &series) {
  series.clear();
  if (request.end < request.start) {
    LOG_ERROR("Query range ends before it starts (%lld < %lld)",
              (long long)request.end, (long long)request.start);
    return QueryStatus::InvalidRange;
  }

  std::vector<std::string> devices;
  bool explicit_device = !request.device_id.empty();
  if (explicit_device) {
    std::string mac;
    QueryStatus status = checkDevice(request.device_id, mac);
    if (status != QueryStatus::Ok)
      return status;
    devices.push_back(mac);
  } else {
    std::vector<Device> known;
    if (!mRegistry.listDevices(known))
      return QueryStatus::StorageError;
    for (auto &device : known)
      devices.push_back(device.mac);
  }

  Resolution resolution = selectResolution(request.start, request.end,
                                           request.resolution, mPointBudget);
  LOG_DEBUG("Query [%lld, %lld] %s, resolution %s", (long long)request.start,
            (long long)request.end,
            explicit_device ? request.device_id.c_str() : "all devices",
            resolutionName(resolution));

  for (auto &mac : devices) {
    Series one;
    one.device_id = mac;
    one.resolution = resolution;

    QueryStatus status;
    if (resolution == Resolution::Raw)
      status = queryRaw(mac, request.start, request.end, request.limit, one);
    else
      status = queryBuckets(mac, request.start, request.end,
                            bucketSeconds(resolution), one);
    if (status != QueryStatus::Ok) {
      series.clear();
      return status;
    }

    if (explicit_device || one.size())
      series.push_back(std::move(one));
  }
  return QueryStatus::Ok;
}

bool SensorStore::getLatest(const std::string &device_id, Reading &reading) {
  std::string mac = normalizeDeviceId(device_id);
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  std::string sql = mSelectSql + "ORDER BY timestamp DESC LIMIT 1";
  Statement stmt(mDb, sql.c_str());
  if (!stmt.ok())
    return false;
  stmt.bind(1, mac);
  stmt.bind(2, (int64_t)INT64_MIN);
  stmt.bind(3, (int64_t)INT64_MAX);
  if (stmt.step() != SQLITE_ROW)
    return false;
  return rowToReading(stmt, reading);
}

QueryStatus SensorStore::count(int64_t start, int64_t end,
                               const std::string &device_id, int64_t &count) {
  count = 0;
  if (end < start)
    return QueryStatus::InvalidRange;

  std::string mac;
  if (!device_id.empty()) {
    QueryStatus status = checkDevice(device_id, mac);
    if (status != QueryStatus::Ok)
      return status;
  }

  const std::lock_guard<std::mutex> lock(mDb.mutex());
  Statement stmt(mDb, mac.empty()
                          ? "SELECT COUNT(*) FROM readings WHERE timestamp "
                            "BETWEEN ?1 AND ?2"
                          : "SELECT COUNT(*) FROM readings WHERE timestamp "
                            "BETWEEN ?1 AND ?2 AND device_id = ?3");
  if (!stmt.ok())
    return QueryStatus::StorageError;
  stmt.bind(1, start);
  stmt.bind(2, end);
  if (!mac.empty())
    stmt.bind(3, mac);
  if (stmt.step() != SQLITE_ROW) {
    LOG_ERROR("Count failed: %s", mDb.errmsg());
    return QueryStatus::StorageError;
  }
  count = stmt.columnInt(0);
  return QueryStatus::Ok;
}

bool SensorStore::getDataRange(int64_t &first, int64_t &last) {
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  Statement stmt(mDb, "SELECT MIN(timestamp), MAX(timestamp) FROM readings");
  if (!stmt.ok() || stmt.step() != SQLITE_ROW || stmt.isNull(0))
    return false;
  first = stmt.columnInt(0);
  last = stmt.columnInt(1);
  return true;
}

QueryStatus SensorStore::summarize(int64_t start, int64_t end,
                                   const std::string &device_id,
                                   Summary &summary) {
  summary = Summary();
  if (end < start)
    return QueryStatus::InvalidRange;

  std::string mac;
  QueryStatus status = checkDevice(device_id, mac);
  if (status != QueryStatus::Ok)
    return status;
  summary.device_id = mac;

  const std::lock_guard<std::mutex> lock(mDb.mutex());
  Statement stmt(mDb, mSummarySql.c_str());
  if (!stmt.ok())
    return QueryStatus::StorageError;
  stmt.bind(1, mac);
  stmt.bind(2, start);
  stmt.bind(3, end);
  if (stmt.step() != SQLITE_ROW) {
    LOG_ERROR("Summary for %s failed: %s", mac.c_str(), mDb.errmsg());
    return QueryStatus::StorageError;
  }

  summary.count = stmt.columnInt(0);
  if (!summary.count)
    return QueryStatus::Ok;
  summary.first = stmt.columnInt(1);
  summary.last = stmt.columnInt(2);
  for (size_t i = 0; i < kFieldCount; i++) {
    int column = 3 + 4 * (int)i;
    int64_t contributing = stmt.columnInt(column + 3);
    if (!contributing)
      continue;
    FieldSummary field;
    field.min = stmt.columnDouble(column);
    field.max = stmt.columnDouble(column + 1);
    field.mean = stmt.columnDouble(column + 2);
    field.count = contributing;
    summary.fields[i] = field;
  }
  return QueryStatus::Ok;
}

QueryStatus SensorStore::findGaps(int64_t start, int64_t end,
                                  const std::string &device_id,
                                  int64_t threshold, std::vector<Gap> &gaps) {
  gaps.clear();
  if (end < start || threshold <= 0)
    return QueryStatus::InvalidRange;

  std::string mac;
  QueryStatus status = checkDevice(device_id, mac);
  if (status != QueryStatus::Ok)
    return status;

  const std::lock_guard<std::mutex> lock(mDb.mutex());
  Statement stmt(mDb, "SELECT timestamp FROM readings WHERE device_id = ?1 "
                      "AND timestamp BETWEEN ?2 AND ?3 ORDER BY timestamp");
  if (!stmt.ok())
    return QueryStatus::StorageError;
  stmt.bind(1, mac);
  stmt.bind(2, start);
  stmt.bind(3, end);

  int rc;
  bool first = true;
  int64_t previous = 0;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    int64_t timestamp = stmt.columnInt(0);
    if (!first && timestamp - previous > threshold)
      gaps.push_back({previous, timestamp});
    previous = timestamp;
    first = false;
  }
  if (rc != SQLITE_DONE) {
    LOG_ERROR("Gap search for %s failed: %s", mac.c_str(), mDb.errmsg());
    return QueryStatus::StorageError;
  }
  return QueryStatus::Ok;
}
