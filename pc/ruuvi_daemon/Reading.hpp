/*
 * Reading.hpp
 *
 *  Created on: 3 jan. 2026
 */

#ifndef READING_HPP_
#define READING_HPP_

#include <array>
#include <optional>
#include <string>

#include <stdint.h>

enum class SensorType : uint8_t {
  Tag,
  Air,
};

// Value is the format byte as broadcast
enum class PayloadFormat : uint8_t {
  RAWv1 = 0x03,
  RAWv2 = 0x05,
  Format6 = 0x06,
  ExtendedV1 = 0xE1,
};

enum class Field : uint8_t {
  Temperature,
  Humidity,
  Pressure,
  AccelerationX,
  AccelerationY,
  AccelerationZ,
  MovementCounter,
  BatteryVoltage,
  TxPower,
  Co2,
  Pm1_0,
  Pm2_5,
  Pm4_0,
  Pm10_0,
  Voc,
  Nox,
  Rssi,
};

constexpr size_t kFieldCount = 17;

enum class FieldScope : uint8_t {
  Common,
  Tag,
  Air,
};

struct FieldInfo {
  Field field;
  const char *name; // database column and json key
  const char *unit;
  FieldScope scope;
  bool integer;
};

const std::array<FieldInfo, kFieldCount> &allFields(void);
const FieldInfo &fieldInfo(Field field);
bool fieldAppliesTo(Field field, SensorType type);

struct Reading {
  std::string device_id;
  int64_t timestamp = 0;
  SensorType sensor_type = SensorType::Tag;
  PayloadFormat format = PayloadFormat::RAWv2;

  // Not persisted, the dedup key is the timestamp
  std::optional<uint32_t> sequence;

  std::array<std::optional<double>, kFieldCount> values = {};

  const std::optional<double> &get(Field field) const {
    return values[static_cast<size_t>(field)];
  }
  void set(Field field, double value) {
    values[static_cast<size_t>(field)] = value;
  }
  void clear(Field field) { values[static_cast<size_t>(field)].reset(); }
  bool has(Field field) const { return get(field).has_value(); }

  // True when no field of the other sensor type is present
  bool isConsistent(void) const;

  bool operator==(const Reading &other) const;
  bool operator!=(const Reading &other) const { return !(*this == other); }
};

const char *sensorTypeName(SensorType type);
bool parseSensorType(const std::string &name, SensorType &type);

const char *formatName(PayloadFormat format);
bool formatFromCode(uint8_t code, PayloadFormat &format);
SensorType sensorTypeForFormat(PayloadFormat format);

// Upper case, "-" separated input becomes ":" separated
std::string normalizeDeviceId(const std::string &device_id);

#endif /* READING_HPP_ */
