/*
 * DeviceRegistry.hpp
 *
 *  Created on: 4 jan. 2026
 */

#ifndef DEVICEREGISTRY_HPP_
#define DEVICEREGISTRY_HPP_

#include <string>
#include <vector>

#include "Database.hpp"
#include "Reading.hpp"

struct Device {
  std::string mac;
  SensorType sensor_type = SensorType::Tag;
  std::string nickname;
  std::string description;
  std::string ble_uuid; // radio pairing id, UUID on some platforms
};

enum class ResolveStatus {
  Existing,
  Created,
  TypeConflict,
  StorageBusy,
  StorageError,
};

const char *resolveStatusName(ResolveStatus status);

class DeviceRegistry {
public:
  explicit DeviceRegistry(Database &db);
  virtual ~DeviceRegistry();

  bool isReady(void) const { return mReady; }

  // Known id: its record, or TypeConflict when sensor_type differs.
  // Unknown id: a new record with a "{type}{n}" nickname, committed before
  // this returns.
  ResolveStatus resolve(const std::string &device_id, SensorType sensor_type,
                        Device &device);

  // Configuration import. Empty fields keep what is stored, the type of a
  // known device cannot change.
  ResolveStatus upsert(const Device &device);

  bool getDevice(const std::string &mac, Device &device);
  bool getDeviceByNickname(const std::string &nickname, Device &device);
  // MAC address or nickname
  bool findDevice(const std::string &identifier, Device &device);
  // Ordered by registration, false when the table cannot be read
  bool listDevices(std::vector<Device> &devices);

private:
  Database &mDb;
  bool mReady = false;

  // Callers hold the database mutex
  int lookup(const std::string &mac, Device &device);
  int nextNickname(SensorType sensor_type, std::string &nickname);
  ResolveStatus create(Device &device);

  const char *mCreateTables = ""
                              "CREATE TABLE IF NOT EXISTS devices ( "
                              "mac TEXT NOT NULL, "
                              "sensor_type TEXT NOT NULL, "
                              "nickname TEXT NOT NULL COLLATE NOCASE, "
                              "description TEXT NOT NULL DEFAULT '', "
                              "ble_uuid TEXT NOT NULL DEFAULT '', "
                              "first_seen INTEGER, "
                              "PRIMARY KEY (mac), "
                              "UNIQUE (nickname) "
                              ");";
};

#endif /* DEVICEREGISTRY_HPP_ */
