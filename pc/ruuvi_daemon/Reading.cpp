/*
 * Reading.cpp
 *
 *  Created on: 3 jan. 2026
 */

#include "Reading.hpp"

#include "utils/splitString.hpp"

static const std::array<FieldInfo, kFieldCount> fields = {{
    {Field::Temperature, "temperature", "°C", FieldScope::Common, false},
    {Field::Humidity, "humidity", "%", FieldScope::Common, false},
    {Field::Pressure, "pressure", "Pa", FieldScope::Common, false},
    {Field::AccelerationX, "acceleration_x", "G", FieldScope::Tag, false},
    {Field::AccelerationY, "acceleration_y", "G", FieldScope::Tag, false},
    {Field::AccelerationZ, "acceleration_z", "G", FieldScope::Tag, false},
    {Field::MovementCounter, "movement_counter", "", FieldScope::Tag, true},
    {Field::BatteryVoltage, "battery_voltage", "V", FieldScope::Tag, false},
    {Field::TxPower, "tx_power", "dBm", FieldScope::Tag, true},
    {Field::Co2, "co2", "ppm", FieldScope::Air, true},
    {Field::Pm1_0, "pm_1_0", "µg/m³", FieldScope::Air, false},
    {Field::Pm2_5, "pm_2_5", "µg/m³", FieldScope::Air, false},
    {Field::Pm4_0, "pm_4_0", "µg/m³", FieldScope::Air, false},
    {Field::Pm10_0, "pm_10_0", "µg/m³", FieldScope::Air, false},
    {Field::Voc, "voc", "index", FieldScope::Air, true},
    {Field::Nox, "nox", "index", FieldScope::Air, true},
    {Field::Rssi, "rssi", "dBm", FieldScope::Common, true},
}};

const std::array<FieldInfo, kFieldCount> &allFields(void) { return fields; }

const FieldInfo &fieldInfo(Field field) {
  return fields[static_cast<size_t>(field)];
}

bool fieldAppliesTo(Field field, SensorType type) {
  switch (fieldInfo(field).scope) {
  case FieldScope::Common:
    return true;
  case FieldScope::Tag:
    return type == SensorType::Tag;
  case FieldScope::Air:
    return type == SensorType::Air;
  }
  return false;
}

bool Reading::isConsistent(void) const {
  for (auto &info : fields) {
    if (has(info.field) && !fieldAppliesTo(info.field, sensor_type))
      return false;
  }
  return true;
}

bool Reading::operator==(const Reading &other) const {
  return device_id == other.device_id && timestamp == other.timestamp &&
         sensor_type == other.sensor_type && format == other.format &&
         sequence == other.sequence && values == other.values;
}

const char *sensorTypeName(SensorType type) {
  switch (type) {
  case SensorType::Tag:
    return "tag";
  case SensorType::Air:
    return "air";
  }
  return "unknown";
}

bool parseSensorType(const std::string &name, SensorType &type) {
  std::string lower = toLower(name);
  if (lower == "tag") {
    type = SensorType::Tag;
    return true;
  }
  if (lower == "air") {
    type = SensorType::Air;
    return true;
  }
  return false;
}

const char *formatName(PayloadFormat format) {
  switch (format) {
  case PayloadFormat::RAWv1:
    return "RAWv1";
  case PayloadFormat::RAWv2:
    return "RAWv2";
  case PayloadFormat::Format6:
    return "Format6";
  case PayloadFormat::ExtendedV1:
    return "ExtendedV1";
  }
  return "unknown";
}

bool formatFromCode(uint8_t code, PayloadFormat &format) {
  switch (code) {
  case 0x03:
    format = PayloadFormat::RAWv1;
    return true;
  case 0x05:
    format = PayloadFormat::RAWv2;
    return true;
  case 0x06:
    format = PayloadFormat::Format6;
    return true;
  case 0xE1:
    format = PayloadFormat::ExtendedV1;
    return true;
  }
  return false;
}

SensorType sensorTypeForFormat(PayloadFormat format) {
  switch (format) {
  case PayloadFormat::Format6:
  case PayloadFormat::ExtendedV1:
    return SensorType::Air;
  default:
    return SensorType::Tag;
  }
}

std::string normalizeDeviceId(const std::string &device_id) {
  std::string result = toUpper(device_id);
  for (auto &c : result) {
    if (c == '-')
      c = ':';
  }
  return result;
}
