/*
 * SensorManager.hpp
 *
 *  Created on: 8 jan. 2026
 */

#ifndef SENSORMANAGER_HPP_
#define SENSORMANAGER_HPP_

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include "Database.hpp"
#include "DeviceRegistry.hpp"
#include "Reading.hpp"
#include "SensorStore.hpp"

enum class IngestStatus {
  Inserted,
  Duplicate,
  DecodeError,
  TypeConflict,
  InvalidReading,
  StorageBusy,
  StorageError,
};

const char *ingestStatusName(IngestStatus status);

struct IngestStats {
  uint64_t inserted = 0;
  uint64_t duplicates = 0;
  uint64_t rejected = 0; // decode errors and invalid readings
  uint64_t conflicts = 0;
  uint64_t errors = 0;
};

// Wires decoder, registry and store together on one database
class SensorManager {
public:
  explicit SensorManager(const std::string &database_path,
                         size_t point_budget = kDefaultPointBudget);
  virtual ~SensorManager();

  bool isReady(void) const;

  // Resolves (and auto registers) the device, then stores the reading
  IngestStatus ingest(const Reading &reading);

  // Raw manufacturer data as received from the radio
  IngestStatus ingestPayload(const std::string &device_id,
                             const std::vector<uint8_t> &payload,
                             uint8_t format_code, int64_t timestamp,
                             std::optional<double> rssi = std::nullopt);

  // Configured devices, returns how many were stored
  size_t importDevices(const std::vector<Device> &devices);

  // device_id in the request may be a MAC address or a nickname
  QueryStatus query(const QueryRequest &request, std::vector<Series> &series);
  QueryStatus summarize(int64_t start, int64_t end,
                        const std::string &identifier, Summary &summary);
  QueryStatus findGaps(int64_t start, int64_t end,
                       const std::string &identifier, int64_t threshold,
                       std::vector<Gap> &gaps);

  IngestStats stats(void) const;

  DeviceRegistry &registry(void) { return mRegistry; }
  SensorStore &store(void) { return mStore; }

private:
  Database mDb;
  DeviceRegistry mRegistry;
  SensorStore mStore;

  std::atomic<uint64_t> mInserted{0};
  std::atomic<uint64_t> mDuplicates{0};
  std::atomic<uint64_t> mRejected{0};
  std::atomic<uint64_t> mConflicts{0};
  std::atomic<uint64_t> mErrors{0};

  bool resolveIdentifier(const std::string &identifier, std::string &mac);
  IngestStatus count(IngestStatus status);
};

#endif /* SENSORMANAGER_HPP_ */
