/*
 * SensorManager.cpp
 *
 *  Created on: 8 jan. 2026
 */

#include "SensorManager.hpp"

#include "PayloadDecoder.hpp"
#include "utils/logger.hpp"

const char *ingestStatusName(IngestStatus status) {
  switch (status) {
  case IngestStatus::Inserted:
    return "inserted";
  case IngestStatus::Duplicate:
    return "duplicate";
  case IngestStatus::DecodeError:
    return "decode error";
  case IngestStatus::TypeConflict:
    return "device type conflict";
  case IngestStatus::InvalidReading:
    return "invalid reading";
  case IngestStatus::StorageBusy:
    return "storage busy";
  case IngestStatus::StorageError:
    return "storage error";
  }
  return "unknown";
}

SensorManager::SensorManager(const std::string &database_path,
                             size_t point_budget)
    : mDb(database_path), mRegistry(mDb),
      mStore(mDb, mRegistry, point_budget) {
  std::vector<Device> devices;
  if (isReady() && mRegistry.listDevices(devices))
    LOG_INFO("Sensor storage ready, %zu known devices, auto resolution "
             "budget %zu points",
             devices.size(), mStore.pointBudget());
  else
    LOG_ERROR("Sensor storage %s is not usable", database_path.c_str());
}

SensorManager::~SensorManager() {}

bool SensorManager::isReady(void) const {
  return mDb.isOpen() && mRegistry.isReady() && mStore.isReady();
}

IngestStatus SensorManager::count(IngestStatus status) {
  switch (status) {
  case IngestStatus::Inserted:
    mInserted++;
    break;
  case IngestStatus::Duplicate:
    mDuplicates++;
    break;
  case IngestStatus::DecodeError:
  case IngestStatus::InvalidReading:
    mRejected++;
    break;
  case IngestStatus::TypeConflict:
    mConflicts++;
    break;
  case IngestStatus::StorageBusy:
  case IngestStatus::StorageError:
    mErrors++;
    break;
  }
  return status;
}

IngestStatus SensorManager::ingest(const Reading &reading) {
  // Checked before the registry sees it, a bad reading registers nothing
  if (reading.device_id.empty() ||
      reading.sensor_type != sensorTypeForFormat(reading.format) ||
      !reading.isConsistent()) {
    LOG_ERROR("Rejecting inconsistent %s reading from '%s'",
              formatName(reading.format), reading.device_id.c_str());
    return count(IngestStatus::InvalidReading);
  }

  Device device;
  switch (mRegistry.resolve(reading.device_id, reading.sensor_type, device)) {
  case ResolveStatus::Existing:
  case ResolveStatus::Created:
    break;
  case ResolveStatus::TypeConflict:
    return count(IngestStatus::TypeConflict);
  case ResolveStatus::StorageBusy:
    return count(IngestStatus::StorageBusy);
  case ResolveStatus::StorageError:
    return count(IngestStatus::StorageError);
  }

  InsertResult result = mStore.insert(reading, device.mac);
  switch (result) {
  case InsertResult::Inserted:
    LOG_DEBUG("Stored %s@%lld (%s)", device.nickname.c_str(),
              (long long)reading.timestamp, formatName(reading.format));
    return count(IngestStatus::Inserted);
  case InsertResult::Duplicate:
    return count(IngestStatus::Duplicate);
  case InsertResult::InvalidReading:
    return count(IngestStatus::InvalidReading);
  case InsertResult::StorageBusy:
    return count(IngestStatus::StorageBusy);
  case InsertResult::UnknownDevice:
  case InsertResult::StorageError:
    break;
  }
  LOG_ERROR("Reading from %s not stored: %s", device.nickname.c_str(),
            insertResultName(result));
  return count(IngestStatus::StorageError);
}

IngestStatus SensorManager::ingestPayload(const std::string &device_id,
                                          const std::vector<uint8_t> &payload,
                                          uint8_t format_code,
                                          int64_t timestamp,
                                          std::optional<double> rssi) {
  Reading reading;
  DecodeStatus status = decodePayload(payload, format_code, reading);
  if (status != DecodeStatus::Ok) {
    LOG_WARNING("Dropping payload 0x%02X from %s: %s", format_code,
                device_id.c_str(), decodeStatusName(status));
    return count(IngestStatus::DecodeError);
  }
  if (reading.device_id.empty())
    reading.device_id = normalizeDeviceId(device_id);
  reading.timestamp = timestamp;
  if (rssi)
    reading.set(Field::Rssi, *rssi);
  return ingest(reading);
}

size_t SensorManager::importDevices(const std::vector<Device> &devices) {
  size_t stored = 0;
  for (auto &device : devices) {
    ResolveStatus status = mRegistry.upsert(device);
    if (status == ResolveStatus::Existing || status == ResolveStatus::Created)
      stored++;
    else
      LOG_WARNING("Configured device %s not stored: %s", device.mac.c_str(),
                  resolveStatusName(status));
  }
  return stored;
}

bool SensorManager::resolveIdentifier(const std::string &identifier,
                                      std::string &mac) {
  Device device;
  if (!mRegistry.findDevice(identifier, device)) {
    LOG_ERROR("No device with MAC address or nickname '%s'",
              identifier.c_str());
    return false;
  }
  mac = device.mac;
  return true;
}

QueryStatus SensorManager::query(const QueryRequest &request,
                                 std::vector<Series> &series) {
  QueryRequest resolved = request;
  if (!request.device_id.empty() &&
      !resolveIdentifier(request.device_id, resolved.device_id)) {
    series.clear();
    return QueryStatus::UnknownDevice;
  }
  QueryStatus status = mStore.query(resolved, series);
  if (status != QueryStatus::Ok)
    LOG_WARNING("Query for '%s' failed: %s", request.device_id.c_str(),
                queryStatusName(status));
  return status;
}

QueryStatus SensorManager::summarize(int64_t start, int64_t end,
                                     const std::string &identifier,
                                     Summary &summary) {
  std::string mac;
  if (!resolveIdentifier(identifier, mac))
    return QueryStatus::UnknownDevice;
  return mStore.summarize(start, end, mac, summary);
}

QueryStatus SensorManager::findGaps(int64_t start, int64_t end,
                                    const std::string &identifier,
                                    int64_t threshold, std::vector<Gap> &gaps) {
  std::string mac;
  if (!resolveIdentifier(identifier, mac))
    return QueryStatus::UnknownDevice;
  return mStore.findGaps(start, end, mac, threshold, gaps);
}

IngestStats SensorManager::stats(void) const {
  IngestStats stats;
  stats.inserted = mInserted;
  stats.duplicates = mDuplicates;
  stats.rejected = mRejected;
  stats.conflicts = mConflicts;
  stats.errors = mErrors;
  return stats;
}
