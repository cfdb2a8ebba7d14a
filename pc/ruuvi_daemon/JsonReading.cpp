/*
 * JsonReading.cpp
 *
 *  Created on: 7 jan. 2026
 */

#include "JsonReading.hpp"

#include <cerrno>
#include <cstdlib>

#include "PayloadDecoder.hpp"
#include "utils/logger.hpp"
#include "utils/splitString.hpp"
#include "utils/time.hpp"

// Gateway history keys
static const struct {
  const char *key;
  Field field;
} historyFields[] = {
    {"temperature", Field::Temperature},
    {"humidity", Field::Humidity},
    {"pressure", Field::Pressure},
    {"accelX", Field::AccelerationX},
    {"accelY", Field::AccelerationY},
    {"accelZ", Field::AccelerationZ},
    {"movementCounter", Field::MovementCounter},
    {"voltage", Field::BatteryVoltage},
    {"txPower", Field::TxPower},
    {"CO2", Field::Co2},
    {"PM1.0", Field::Pm1_0},
    {"PM2.5", Field::Pm2_5},
    {"PM4.0", Field::Pm4_0},
    {"PM10.0", Field::Pm10_0},
    {"VOC", Field::Voc},
    {"NOx", Field::Nox},
    {"rssi", Field::Rssi},
};

static bool isDigits(const std::string &text) {
  return !text.empty() && text.find_first_not_of("0123456789") == std::string::npos;
}

// Epoch seconds as number or string, or ISO-8601
static bool jsonToTimestamp(const nlohmann::json &value, int64_t &timestamp) {
  if (value.is_number_unsigned()) {
    uint64_t seconds = value.get<uint64_t>();
    if (seconds > (uint64_t)INT64_MAX)
      return false;
    timestamp = (int64_t)seconds;
    return true;
  }
  if (value.is_number_integer()) {
    timestamp = value.get<int64_t>();
    return true;
  }
  if (value.is_number_float()) {
    double seconds = value.get<double>();
    // 2^63 is exact as a double, anything at or above it does not fit
    if (!(seconds >= -9223372036854775808.0 && seconds < 9223372036854775808.0))
      return false;
    timestamp = (int64_t)seconds;
    return true;
  }
  if (value.is_string()) {
    std::string text = value.get<std::string>();
    if (isDigits(text)) {
      errno = 0;
      long long seconds = std::strtoll(text.c_str(), nullptr, 10);
      if (errno == ERANGE)
        return false;
      timestamp = seconds;
      return true;
    }
    return parseIsoTime(text, timestamp);
  }
  return false;
}

static bool jsonToFormat(const nlohmann::json &value, PayloadFormat &format) {
  if (value.is_number_integer()) {
    if (value.is_number_unsigned())
      return value.get<uint64_t>() <= 0xFF &&
             formatFromCode((uint8_t)value.get<uint64_t>(), format);
    int64_t code = value.get<int64_t>();
    if (code < 0 || code > 0xFF)
      return false;
    return formatFromCode((uint8_t)code, format);
  }
  if (value.is_string()) {
    // "E1" or "e1" as shown by some gateway firmware
    std::string text = value.get<std::string>();
    char *end = nullptr;
    unsigned long code = std::strtoul(text.c_str(), &end, 16);
    if (text.empty() || *end || code > 0xFF)
      return false;
    return formatFromCode((uint8_t)code, format);
  }
  return false;
}

bool readingFromRawHex(const std::string &device_id, const std::string &hex,
                       int64_t timestamp, std::optional<double> rssi,
                       Reading &reading) {
  std::vector<uint8_t> bytes;
  if (!hexToBytes(hex, bytes)) {
    LOG_ERROR("Invalid hex data '%s'", hex.c_str());
    return false;
  }

  Reading decoded;
  DecodeStatus status = decodeAdvertisement(bytes, decoded);
  if (status != DecodeStatus::Ok) {
    LOG_WARNING("Dropping data from %s: %s", device_id.c_str(),
                decodeStatusName(status));
    return false;
  }

  if (decoded.device_id.empty())
    decoded.device_id = normalizeDeviceId(device_id);
  if (decoded.device_id.empty()) {
    LOG_WARNING("Dropping %s data without device id",
                formatName(decoded.format));
    return false;
  }
  decoded.timestamp = timestamp;
  if (rssi)
    decoded.set(Field::Rssi, *rssi);

  reading = decoded;
  return true;
}

bool parseMqttMessage(const std::string &topic, const std::string &payload,
                      int64_t now, Reading &reading) {
  nlohmann::json json = nlohmann::json::parse(payload, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    LOG_WARNING("Ignoring non JSON message on %s", topic.c_str());
    return false;
  }

  auto data = json.find("data");
  if (data == json.end() || !data->is_string()) {
    LOG_DEBUG("Message on %s has no data", topic.c_str());
    return false;
  }

  int64_t timestamp = now;
  auto ts = json.find("ts");
  if (ts != json.end() && !jsonToTimestamp(*ts, timestamp)) {
    LOG_WARNING("Unparsable ts %s on %s, using receive time",
                ts->dump().c_str(), topic.c_str());
    timestamp = now;
  }

  std::optional<double> rssi;
  auto rssi_it = json.find("rssi");
  if (rssi_it != json.end() && rssi_it->is_number())
    rssi = rssi_it->get<double>();

  // ruuvi/<gateway mac>/<tag mac>
  auto segments = splitString(topic, "/");
  std::string fallback_id = segments.empty() ? "" : segments.back();

  return readingFromRawHex(fallback_id, data->get<std::string>(), timestamp,
                           rssi, reading);
}

static bool historyRecord(const std::string &mac, const nlohmann::json &tag,
                          Reading &reading) {
  int64_t timestamp;
  auto ts = tag.find("timestamp");
  if (ts == tag.end() || !jsonToTimestamp(*ts, timestamp)) {
    LOG_WARNING("Gateway record for %s has no timestamp", mac.c_str());
    return false;
  }

  std::optional<double> rssi;
  auto rssi_it = tag.find("rssi");
  if (rssi_it != tag.end() && rssi_it->is_number())
    rssi = rssi_it->get<double>();

  // Raw mode gateways only forward the advertisement
  auto format_it = tag.find("dataFormat");
  auto data = tag.find("data");
  if (format_it == tag.end() && data != tag.end() && data->is_string())
    return readingFromRawHex(mac, data->get<std::string>(), timestamp, rssi,
                             reading);

  Reading parsed;
  if (format_it == tag.end() || !jsonToFormat(*format_it, parsed.format)) {
    LOG_WARNING("Gateway record for %s has no known dataFormat", mac.c_str());
    return false;
  }
  parsed.sensor_type = sensorTypeForFormat(parsed.format);
  parsed.device_id = normalizeDeviceId(mac);
  parsed.timestamp = timestamp;

  auto sequence = tag.find("measurementSequenceNumber");
  if (sequence != tag.end() && sequence->is_number_unsigned())
    parsed.sequence = sequence->get<uint32_t>();

  for (auto &entry : historyFields) {
    auto value = tag.find(entry.key);
    if (value == tag.end() || !value->is_number())
      continue;
    // Gateways report every key they know, keep what fits the sensor
    if (!fieldAppliesTo(entry.field, parsed.sensor_type))
      continue;
    parsed.set(entry.field, value->get<double>());
  }

  reading = parsed;
  return true;
}

bool parseGatewayHistory(const std::string &body,
                         std::vector<Reading> &readings) {
  nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    LOG_ERROR("Gateway history is not a JSON object");
    return false;
  }

  auto data = json.find("data");
  if (data == json.end() || !data->is_object()) {
    LOG_ERROR("Gateway history has no data object");
    return false;
  }
  auto tags = data->find("tags");
  if (tags == data->end()) {
    // A gateway that saw nothing yet
    return true;
  }
  if (!tags->is_object()) {
    LOG_ERROR("Gateway history tags is not an object");
    return false;
  }

  for (auto &[mac, tag] : tags->items()) {
    if (!tag.is_object())
      continue;
    Reading reading;
    if (historyRecord(mac, tag, reading))
      readings.push_back(reading);
  }
  return true;
}

nlohmann::json readingToJson(const Reading &reading) {
  nlohmann::json json;
  json["device_id"] = reading.device_id;
  json["timestamp"] = reading.timestamp;
  json["time"] = formatIsoTime(reading.timestamp);
  json["sensor_type"] = sensorTypeName(reading.sensor_type);
  json["data_format"] = formatName(reading.format);
  if (reading.sequence)
    json["sequence"] = *reading.sequence;
  for (auto &info : allFields()) {
    auto &value = reading.get(info.field);
    if (!value)
      continue;
    if (info.integer)
      json[info.name] = (int64_t)*value;
    else
      json[info.name] = *value;
  }
  return json;
}
