/*
 * DeviceRegistry.cpp
 *
 *  Created on: 4 jan. 2026
 */

#include "DeviceRegistry.hpp"

#include <set>

#include "utils/logger.hpp"
#include "utils/time.hpp"

static const char *kSelectColumns =
    "SELECT mac, sensor_type, nickname, description, ble_uuid FROM devices ";

static bool isBusy(int rc) { return (rc & 0xFF) == SQLITE_BUSY; }

static void rowToDevice(Statement &stmt, Device &device) {
  device.mac = stmt.columnText(0);
  if (!parseSensorType(stmt.columnText(1), device.sensor_type)) {
    LOG_WARNING("Device %s has unknown sensor type '%s'", device.mac.c_str(),
                stmt.columnText(1).c_str());
  }
  device.nickname = stmt.columnText(2);
  device.description = stmt.columnText(3);
  device.ble_uuid = stmt.columnText(4);
}

const char *resolveStatusName(ResolveStatus status) {
  switch (status) {
  case ResolveStatus::Existing:
    return "existing";
  case ResolveStatus::Created:
    return "created";
  case ResolveStatus::TypeConflict:
    return "type conflict";
  case ResolveStatus::StorageBusy:
    return "storage busy";
  case ResolveStatus::StorageError:
    return "storage error";
  }
  return "unknown";
}

DeviceRegistry::DeviceRegistry(Database &db) : mDb(db) {
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  int rc = mDb.exec(mCreateTables);
  if (rc != SQLITE_OK) {
    LOG_ERROR("Failed to create device table: %s", mDb.errmsg());
  } else {
    mReady = true;
  }
}

DeviceRegistry::~DeviceRegistry() {}

int DeviceRegistry::lookup(const std::string &mac, Device &device) {
  std::string sql = std::string(kSelectColumns) + "WHERE mac = ?";
  Statement stmt(mDb, sql.c_str());
  if (!stmt.ok())
    return stmt.prepareResult();
  stmt.bind(1, mac);
  int rc = stmt.step();
  if (rc == SQLITE_ROW)
    rowToDevice(stmt, device);
  return rc;
}

int DeviceRegistry::nextNickname(SensorType sensor_type,
                                 std::string &nickname) {
  std::string prefix = sensorTypeName(sensor_type);
  Statement stmt(mDb, "SELECT nickname FROM devices WHERE nickname LIKE ?");
  if (!stmt.ok())
    return stmt.prepareResult();
  stmt.bind(1, prefix + "%");

  std::set<long> used;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    std::string suffix = stmt.columnText(0).substr(prefix.size());
    if (suffix.empty() || suffix.size() > 9 ||
        suffix.find_first_not_of("0123456789") != std::string::npos)
      continue;
    used.insert(std::stol(suffix));
  }
  if (rc != SQLITE_DONE)
    return rc;

  long number = 1;
  while (used.count(number))
    number++;
  nickname = prefix + std::to_string(number);
  return SQLITE_OK;
}

ResolveStatus DeviceRegistry::create(Device &device) {
  int rc;
  if (device.nickname.empty()) {
    rc = nextNickname(device.sensor_type, device.nickname);
    if (rc != SQLITE_OK) {
      LOG_ERROR("Failed to generate nickname: %s", mDb.errmsg());
      return isBusy(rc) ? ResolveStatus::StorageBusy
                        : ResolveStatus::StorageError;
    }
  }

  Statement stmt(mDb, "INSERT INTO devices (mac, sensor_type, nickname, "
                      "description, ble_uuid, first_seen) "
                      "VALUES (?, ?, ?, ?, ?, ?)");
  if (!stmt.ok())
    return ResolveStatus::StorageError;
  stmt.bind(1, device.mac);
  stmt.bind(2, std::string(sensorTypeName(device.sensor_type)));
  stmt.bind(3, device.nickname);
  stmt.bind(4, device.description);
  stmt.bind(5, device.ble_uuid);
  stmt.bind(6, getUnixTime());
  rc = stmt.step();
  if (rc != SQLITE_DONE) {
    LOG_ERROR("Failed to register device %s as %s: %s", device.mac.c_str(),
              device.nickname.c_str(), mDb.errmsg());
    return isBusy(rc) ? ResolveStatus::StorageBusy
                      : ResolveStatus::StorageError;
  }
  return ResolveStatus::Created;
}

ResolveStatus DeviceRegistry::resolve(const std::string &device_id,
                                      SensorType sensor_type, Device &device) {
  std::string mac = normalizeDeviceId(device_id);
  if (mac.empty()) {
    LOG_ERROR("Cannot resolve a device without id");
    return ResolveStatus::StorageError;
  }

  const std::lock_guard<std::mutex> lock(mDb.mutex());

  Device found;
  int rc = lookup(mac, found);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    return isBusy(rc) ? ResolveStatus::StorageBusy
                      : ResolveStatus::StorageError;

  if (rc == SQLITE_DONE) {
    // Another process may register it between our lookup and the write lock
    rc = mDb.begin();
    if (rc != SQLITE_OK) {
      LOG_ERROR("Failed to start transaction: %s", mDb.errmsg());
      return isBusy(rc) ? ResolveStatus::StorageBusy
                        : ResolveStatus::StorageError;
    }
    rc = lookup(mac, found);
    if (rc == SQLITE_DONE) {
      found = Device();
      found.mac = mac;
      found.sensor_type = sensor_type;
      ResolveStatus status = create(found);
      if (status != ResolveStatus::Created) {
        mDb.rollback();
        return status;
      }
      rc = mDb.commit();
      if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to commit device %s: %s", mac.c_str(), mDb.errmsg());
        mDb.rollback();
        return isBusy(rc) ? ResolveStatus::StorageBusy
                          : ResolveStatus::StorageError;
      }
      LOG_INFO("Registered new %s device %s as %s", sensorTypeName(sensor_type),
               mac.c_str(), found.nickname.c_str());
      device = found;
      return ResolveStatus::Created;
    }
    mDb.rollback();
    if (rc != SQLITE_ROW)
      return isBusy(rc) ? ResolveStatus::StorageBusy
                        : ResolveStatus::StorageError;
  }

  device = found;
  if (found.sensor_type != sensor_type) {
    LOG_ERROR("Device %s (%s) is registered as %s, refusing %s data",
              mac.c_str(), found.nickname.c_str(),
              sensorTypeName(found.sensor_type), sensorTypeName(sensor_type));
    return ResolveStatus::TypeConflict;
  }
  return ResolveStatus::Existing;
}

ResolveStatus DeviceRegistry::upsert(const Device &device) {
  std::string mac = normalizeDeviceId(device.mac);
  if (mac.empty()) {
    LOG_ERROR("Cannot store a device without MAC address");
    return ResolveStatus::StorageError;
  }

  const std::lock_guard<std::mutex> lock(mDb.mutex());

  int rc = mDb.begin();
  if (rc != SQLITE_OK)
    return isBusy(rc) ? ResolveStatus::StorageBusy
                      : ResolveStatus::StorageError;

  Device found;
  rc = lookup(mac, found);
  if (rc == SQLITE_DONE) {
    Device created = device;
    created.mac = mac;
    ResolveStatus status = create(created);
    if (status != ResolveStatus::Created) {
      mDb.rollback();
      return status;
    }
    rc = mDb.commit();
    if (rc != SQLITE_OK) {
      mDb.rollback();
      return isBusy(rc) ? ResolveStatus::StorageBusy
                        : ResolveStatus::StorageError;
    }
    LOG_INFO("Added %s device %s as %s", sensorTypeName(created.sensor_type),
             mac.c_str(), created.nickname.c_str());
    return ResolveStatus::Created;
  }
  if (rc != SQLITE_ROW) {
    mDb.rollback();
    return isBusy(rc) ? ResolveStatus::StorageBusy
                      : ResolveStatus::StorageError;
  }

  if (found.sensor_type != device.sensor_type) {
    mDb.rollback();
    LOG_ERROR("Device %s is registered as %s, configuration says %s",
              mac.c_str(), sensorTypeName(found.sensor_type),
              sensorTypeName(device.sensor_type));
    return ResolveStatus::TypeConflict;
  }

  Statement stmt(mDb, "UPDATE devices SET nickname = ?, description = ?, "
                      "ble_uuid = ? WHERE mac = ?");
  if (!stmt.ok()) {
    mDb.rollback();
    return ResolveStatus::StorageError;
  }
  stmt.bind(1, device.nickname.empty() ? found.nickname : device.nickname);
  stmt.bind(2, device.description.empty() ? found.description
                                          : device.description);
  stmt.bind(3, device.ble_uuid.empty() ? found.ble_uuid : device.ble_uuid);
  stmt.bind(4, mac);
  rc = stmt.step();
  if (rc != SQLITE_DONE) {
    LOG_ERROR("Failed to update device %s: %s", mac.c_str(), mDb.errmsg());
    mDb.rollback();
    return isBusy(rc) ? ResolveStatus::StorageBusy
                      : ResolveStatus::StorageError;
  }
  rc = mDb.commit();
  if (rc != SQLITE_OK) {
    mDb.rollback();
    return isBusy(rc) ? ResolveStatus::StorageBusy
                      : ResolveStatus::StorageError;
  }
  return ResolveStatus::Existing;
}

bool DeviceRegistry::getDevice(const std::string &mac, Device &device) {
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  return lookup(normalizeDeviceId(mac), device) == SQLITE_ROW;
}

bool DeviceRegistry::getDeviceByNickname(const std::string &nickname,
                                         Device &device) {
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  std::string sql = std::string(kSelectColumns) + "WHERE nickname = ?";
  Statement stmt(mDb, sql.c_str());
  if (!stmt.ok())
    return false;
  stmt.bind(1, nickname);
  if (stmt.step() != SQLITE_ROW)
    return false;
  rowToDevice(stmt, device);
  return true;
}

bool DeviceRegistry::findDevice(const std::string &identifier,
                                Device &device) {
  if (identifier.empty())
    return false;
  return getDevice(identifier, device) ||
         getDeviceByNickname(identifier, device);
}

bool DeviceRegistry::listDevices(std::vector<Device> &devices) {
  devices.clear();
  const std::lock_guard<std::mutex> lock(mDb.mutex());
  std::string sql = std::string(kSelectColumns) + "ORDER BY rowid";
  Statement stmt(mDb, sql.c_str());
  if (!stmt.ok())
    return false;

  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Device device;
    rowToDevice(stmt, device);
    devices.push_back(device);
  }
  if (rc != SQLITE_DONE) {
    LOG_ERROR("Failed to list devices: %s", mDb.errmsg());
    devices.clear();
    return false;
  }
  return true;
}
