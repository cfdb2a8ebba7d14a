/*
 * PayloadDecoder.cpp
 *
 *  Created on: 3 jan. 2026
 */

#include "PayloadDecoder.hpp"

#include <stdio.h>

// Ruuvi Innovations company identifier 0x0499, little endian on air
static const uint8_t kManufacturerMarker[] = {0xFF, 0x99, 0x04};

static const size_t kRawV1Length = 14;
static const size_t kRawV2Length = 24;
static const size_t kFormat6Length = 20;
static const size_t kExtendedV1Length = 40;

static inline uint16_t u16(const uint8_t *p) {
  return (uint16_t)((p[0] << 8) | p[1]);
}

static inline int16_t s16(const uint8_t *p) { return (int16_t)u16(p); }

static inline uint32_t u24(const uint8_t *p) {
  return ((uint32_t)p[0] << 16) | ((uint32_t)p[1] << 8) | p[2];
}

static std::string macToString(const uint8_t *p) {
  char buffer[18];
  snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X", p[0], p[1],
           p[2], p[3], p[4], p[5]);
  return buffer;
}

// Temperature, humidity and pressure share one layout in RAWv2, 6 and E1
static void decodeClimate(const uint8_t *p, Reading &reading) {
  int16_t temperature = s16(p + 1);
  if (temperature != INT16_MIN)
    reading.set(Field::Temperature, temperature / 200.0);

  uint16_t humidity = u16(p + 3);
  if (humidity != 0xFFFF)
    reading.set(Field::Humidity, humidity / 400.0);

  uint16_t pressure = u16(p + 5);
  if (pressure != 0xFFFF)
    reading.set(Field::Pressure, pressure + 50000.0);
}

static void decodeAcceleration(const uint8_t *p, Field field, Reading &reading,
                               bool has_sentinel) {
  int16_t milli_g = s16(p);
  if (has_sentinel && milli_g == INT16_MIN)
    return;
  reading.set(field, milli_g / 1000.0);
}

static void decodePm(const uint8_t *p, Field field, Reading &reading) {
  uint16_t raw = u16(p);
  if (raw != 0xFFFF)
    reading.set(field, raw / 10.0);
}

// VOC and NOx are 9 bit, the low bit lives in the flags byte
static void decodeIndex(uint8_t high, bool low, Field field, Reading &reading) {
  if (high == 0xFF)
    return;
  reading.set(field, (high << 1) | (low ? 1 : 0));
}

static void decodeRawV1(const uint8_t *p, Reading &reading) {
  reading.set(Field::Humidity, p[1] * 0.5);

  double temperature = (p[2] & 0x7F) + p[3] / 100.0;
  if (p[2] & 0x80)
    temperature = -temperature;
  reading.set(Field::Temperature, temperature);

  reading.set(Field::Pressure, u16(p + 4) + 50000.0);

  decodeAcceleration(p + 6, Field::AccelerationX, reading, false);
  decodeAcceleration(p + 8, Field::AccelerationY, reading, false);
  decodeAcceleration(p + 10, Field::AccelerationZ, reading, false);

  uint16_t power = u16(p + 12);
  reading.set(Field::BatteryVoltage, ((power >> 5) + 1600) / 1000.0);
  reading.set(Field::TxPower, (power & 0x1F) * 2 - 40);
}

static void decodeRawV2(const uint8_t *p, Reading &reading) {
  decodeClimate(p, reading);

  decodeAcceleration(p + 7, Field::AccelerationX, reading, true);
  decodeAcceleration(p + 9, Field::AccelerationY, reading, true);
  decodeAcceleration(p + 11, Field::AccelerationZ, reading, true);

  uint16_t power = u16(p + 13);
  uint16_t battery = power >> 5;
  uint16_t tx_power = power & 0x1F;
  if (battery != 0x7FF)
    reading.set(Field::BatteryVoltage, (battery + 1600) / 1000.0);
  if (tx_power != 0x1F)
    reading.set(Field::TxPower, tx_power * 2 - 40);

  if (p[15] != 0xFF)
    reading.set(Field::MovementCounter, p[15]);

  uint16_t sequence = u16(p + 16);
  if (sequence != 0xFFFF)
    reading.sequence = sequence;

  reading.device_id = macToString(p + 18);
}

static void decodeFormat6(const uint8_t *p, Reading &reading) {
  decodeClimate(p, reading);

  decodePm(p + 7, Field::Pm2_5, reading);

  uint16_t co2 = u16(p + 9);
  if (co2 != 0xFFFF)
    reading.set(Field::Co2, co2);

  uint8_t flags = p[16];
  decodeIndex(p[11], flags & 0x40, Field::Voc, reading);
  decodeIndex(p[12], flags & 0x80, Field::Nox, reading);

  // 13 luminosity and 14 sound level are not stored
  reading.sequence = p[15];
}

static void decodeExtendedV1(const uint8_t *p, Reading &reading) {
  decodeClimate(p, reading);

  decodePm(p + 7, Field::Pm1_0, reading);
  decodePm(p + 9, Field::Pm2_5, reading);
  decodePm(p + 11, Field::Pm4_0, reading);
  decodePm(p + 13, Field::Pm10_0, reading);

  uint16_t co2 = u16(p + 15);
  if (co2 != 0xFFFF)
    reading.set(Field::Co2, co2);

  uint8_t flags = p[28];
  decodeIndex(p[17], flags & 0x40, Field::Voc, reading);
  decodeIndex(p[18], flags & 0x80, Field::Nox, reading);

  uint32_t sequence = u24(p + 25);
  if (sequence != 0xFFFFFF)
    reading.sequence = sequence;

  reading.device_id = macToString(p + 34);
}

const char *decodeStatusName(DecodeStatus status) {
  switch (status) {
  case DecodeStatus::Ok:
    return "ok";
  case DecodeStatus::TruncatedPayload:
    return "truncated payload";
  case DecodeStatus::UnsupportedFormat:
    return "unsupported format";
  }
  return "unknown";
}

size_t minimumPayloadLength(uint8_t format_code) {
  PayloadFormat format;
  if (!formatFromCode(format_code, format))
    return 0;
  switch (format) {
  case PayloadFormat::RAWv1:
    return kRawV1Length;
  case PayloadFormat::RAWv2:
    return kRawV2Length;
  case PayloadFormat::Format6:
    return kFormat6Length;
  case PayloadFormat::ExtendedV1:
    return kExtendedV1Length;
  }
  return 0;
}

DecodeStatus decodePayload(const uint8_t *payload, size_t size,
                           uint8_t format_code, Reading &reading) {
  PayloadFormat format;
  if (!formatFromCode(format_code, format))
    return DecodeStatus::UnsupportedFormat;
  if (!payload || size < minimumPayloadLength(format_code))
    return DecodeStatus::TruncatedPayload;

  reading.values = {};
  reading.sequence.reset();
  reading.format = format;
  reading.sensor_type = sensorTypeForFormat(format);

  switch (format) {
  case PayloadFormat::RAWv1:
    decodeRawV1(payload, reading);
    break;
  case PayloadFormat::RAWv2:
    decodeRawV2(payload, reading);
    break;
  case PayloadFormat::Format6:
    decodeFormat6(payload, reading);
    break;
  case PayloadFormat::ExtendedV1:
    decodeExtendedV1(payload, reading);
    break;
  }
  return DecodeStatus::Ok;
}

DecodeStatus decodePayload(const std::vector<uint8_t> &payload,
                           uint8_t format_code, Reading &reading) {
  return decodePayload(payload.data(), payload.size(), format_code, reading);
}

DecodeStatus decodeAdvertisement(const std::vector<uint8_t> &data,
                                 Reading &reading) {
  size_t offset = data.size();
  for (size_t i = 0; i + sizeof(kManufacturerMarker) < data.size(); i++) {
    if (data[i] == kManufacturerMarker[0] &&
        data[i + 1] == kManufacturerMarker[1] &&
        data[i + 2] == kManufacturerMarker[2]) {
      offset = i + sizeof(kManufacturerMarker);
      break;
    }
  }

  if (offset == data.size()) {
    // No advertisement framing, maybe the bare payload
    PayloadFormat format;
    if (data.empty())
      return DecodeStatus::TruncatedPayload;
    if (!formatFromCode(data[0], format))
      return DecodeStatus::UnsupportedFormat;
    offset = 0;
  }

  return decodePayload(data.data() + offset, data.size() - offset,
                       data[offset], reading);
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool hexToBytes(const std::string &hex, std::vector<uint8_t> &bytes) {
  if (hex.size() % 2)
    return false;
  std::vector<uint8_t> result;
  result.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hexValue(hex[i]);
    int low = hexValue(hex[i + 1]);
    if (high < 0 || low < 0)
      return false;
    result.push_back((uint8_t)((high << 4) | low));
  }
  bytes.swap(result);
  return true;
}
