#include <unity.h>

#include <string>
#include <vector>

#include "PayloadDecoder.hpp"
#include "utils/logger.hpp"

// Ruuvi reference vectors
static const char *kRawV2Valid = "0512FC5394C37C0004FFFC040CAC364200CDCBB8334C884F";
static const char *kRawV2Minimum = "058001000000008001800180010000000000CBB8334C884F";
static const char *kRawV2Invalid = "058000FFFFFFFF800080008000FFFFFFFFFFFFFFFFFFFFFF";
static const char *kRawV1Valid = "03291A1ECE1EFC18F94202CA0B53";
static const char *kExtendedAdvertisement =
    "2BFF9904E112045944B9FE00C000CD00D100D302211C00FFFFFFFFFFFF1DE2F1F8FFFFFFFF"
    "FFAABBCCDDEEFF030398FC";

static std::vector<uint8_t> bytesOf(const char *hex) {
  std::vector<uint8_t> bytes;
  TEST_ASSERT_TRUE(hexToBytes(hex, bytes));
  return bytes;
}

// 22.5 C, 45 %, 100000 Pa, PM2.5 12.3, CO2 700, VOC 101, NOx 2
static std::vector<uint8_t> format6Payload(void) {
  return {0x06, 0x11, 0x94, 0x46, 0x50, 0xC3, 0x50, 0x00, 0x7B, 0x02,
          0xBC, 0x32, 0x01, 0x20, 0x30, 0x10, 0x40, 0xAA, 0xBB, 0xCC};
}

static std::vector<uint8_t> extendedPayload(void) {
  std::vector<uint8_t> advertisement = bytesOf(kExtendedAdvertisement);
  // Skip length and FF 99 04, keep the 40 payload bytes
  return std::vector<uint8_t>(advertisement.begin() + 4,
                              advertisement.begin() + 44);
}

void setUp(void) { utils::logger::set_log_file(""); }

void tearDown(void) {}

void test_rawv2_reference_vector(void) {
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(bytesOf(kRawV2Valid), 0x05, reading));

  TEST_ASSERT_TRUE(reading.sensor_type == SensorType::Tag);
  TEST_ASSERT_TRUE(reading.format == PayloadFormat::RAWv2);
  TEST_ASSERT_EQUAL_STRING("CB:B8:33:4C:88:4F", reading.device_id.c_str());
  TEST_ASSERT_FLOAT_WITHIN(0.001, 24.3, *reading.get(Field::Temperature));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 53.49, *reading.get(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.5, 100044, *reading.get(Field::Pressure));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 0.004, *reading.get(Field::AccelerationX));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, -0.004, *reading.get(Field::AccelerationY));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.036, *reading.get(Field::AccelerationZ));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 2.977, *reading.get(Field::BatteryVoltage));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 4, *reading.get(Field::TxPower));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 66, *reading.get(Field::MovementCounter));
  TEST_ASSERT_TRUE(reading.sequence.has_value());
  TEST_ASSERT_EQUAL_UINT32(205, *reading.sequence);
  TEST_ASSERT_FALSE(reading.has(Field::Co2));
  TEST_ASSERT_TRUE(reading.isConsistent());
}

void test_rawv2_temperature_scale(void) {
  std::vector<uint8_t> payload = bytesOf(kRawV2Valid);
  payload[1] = 0x01;
  payload[2] = 0x2C;

  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0x05, reading));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.5, *reading.get(Field::Temperature));
}

void test_rawv2_temperature_sentinel_is_absent(void) {
  std::vector<uint8_t> payload = bytesOf(kRawV2Valid);
  payload[1] = 0x80;
  payload[2] = 0x00;

  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0x05, reading));
  TEST_ASSERT_FALSE(reading.has(Field::Temperature));
  TEST_ASSERT_TRUE(reading.has(Field::Humidity));
  TEST_ASSERT_TRUE(reading.has(Field::Pressure));
}

void test_rawv2_all_sentinels(void) {
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(bytesOf(kRawV2Invalid), 0x05, reading));

  for (auto &info : allFields())
    TEST_ASSERT_FALSE_MESSAGE(reading.has(info.field), info.name);
  TEST_ASSERT_FALSE(reading.sequence.has_value());
}

void test_rawv2_minimum_values_are_not_absent(void) {
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(bytesOf(kRawV2Minimum), 0x05, reading));

  TEST_ASSERT_FLOAT_WITHIN(0.001, -163.835, *reading.get(Field::Temperature));
  TEST_ASSERT_TRUE(reading.has(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 0, *reading.get(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.5, 50000, *reading.get(Field::Pressure));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, -32.767, *reading.get(Field::AccelerationX));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.6, *reading.get(Field::BatteryVoltage));
  TEST_ASSERT_FLOAT_WITHIN(0.001, -40, *reading.get(Field::TxPower));
  TEST_ASSERT_TRUE(reading.has(Field::MovementCounter));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 0, *reading.get(Field::MovementCounter));
  TEST_ASSERT_EQUAL_UINT32(0, *reading.sequence);
}

void test_rawv1_reference_vector(void) {
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(bytesOf(kRawV1Valid), 0x03, reading));

  TEST_ASSERT_TRUE(reading.sensor_type == SensorType::Tag);
  TEST_ASSERT_TRUE(reading.format == PayloadFormat::RAWv1);
  TEST_ASSERT_TRUE(reading.device_id.empty());
  TEST_ASSERT_FLOAT_WITHIN(0.001, 20.5, *reading.get(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 26.3, *reading.get(Field::Temperature));
  TEST_ASSERT_FLOAT_WITHIN(0.5, 102766, *reading.get(Field::Pressure));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, -1.0, *reading.get(Field::AccelerationX));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, -1.726, *reading.get(Field::AccelerationY));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 0.714, *reading.get(Field::AccelerationZ));
  TEST_ASSERT_TRUE(reading.has(Field::BatteryVoltage));
  TEST_ASSERT_TRUE(reading.has(Field::TxPower));
}

void test_rawv1_pressure_and_negative_temperature(void) {
  // 51325 = 0xC87D, -1.69 C
  std::vector<uint8_t> payload = {0x03, 0x64, 0x81, 0x45, 0xC8, 0x7D, 0x00,
                                  0x00, 0x00, 0x00, 0x03, 0xE8, 0x00, 0x00};
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0x03, reading));
  TEST_ASSERT_FLOAT_WITHIN(0.5, 101325, *reading.get(Field::Pressure));
  TEST_ASSERT_FLOAT_WITHIN(0.001, -1.69, *reading.get(Field::Temperature));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 50, *reading.get(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.0, *reading.get(Field::AccelerationZ));
  TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.6, *reading.get(Field::BatteryVoltage));
  TEST_ASSERT_FLOAT_WITHIN(0.001, -40, *reading.get(Field::TxPower));
}

void test_format6_payload(void) {
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(format6Payload(), 0x06, reading));

  TEST_ASSERT_TRUE(reading.sensor_type == SensorType::Air);
  TEST_ASSERT_TRUE(reading.format == PayloadFormat::Format6);
  TEST_ASSERT_TRUE(reading.device_id.empty());
  TEST_ASSERT_FLOAT_WITHIN(0.001, 22.5, *reading.get(Field::Temperature));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 45.0, *reading.get(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.5, 100000, *reading.get(Field::Pressure));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 12.3, *reading.get(Field::Pm2_5));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 700, *reading.get(Field::Co2));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 101, *reading.get(Field::Voc));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 2, *reading.get(Field::Nox));
  TEST_ASSERT_EQUAL_UINT32(0x10, *reading.sequence);
  TEST_ASSERT_FALSE(reading.has(Field::Pm1_0));
  TEST_ASSERT_FALSE(reading.has(Field::BatteryVoltage));
  TEST_ASSERT_TRUE(reading.isConsistent());
}

void test_format6_index_sentinel(void) {
  std::vector<uint8_t> payload = format6Payload();
  payload[11] = 0xFF;
  payload[16] |= 0x40;

  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0x06, reading));
  TEST_ASSERT_FALSE(reading.has(Field::Voc));
  TEST_ASSERT_TRUE(reading.has(Field::Nox));
}

void test_extended_advertisement(void) {
  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodeAdvertisement(bytesOf(kExtendedAdvertisement),
                                       reading));

  TEST_ASSERT_TRUE(reading.sensor_type == SensorType::Air);
  TEST_ASSERT_TRUE(reading.format == PayloadFormat::ExtendedV1);
  TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", reading.device_id.c_str());
  TEST_ASSERT_FLOAT_WITHIN(0.001, 23.06, *reading.get(Field::Temperature));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 57.13, *reading.get(Field::Humidity));
  TEST_ASSERT_FLOAT_WITHIN(0.5, 97614, *reading.get(Field::Pressure));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 19.2, *reading.get(Field::Pm1_0));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 20.5, *reading.get(Field::Pm2_5));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 20.9, *reading.get(Field::Pm4_0));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 21.1, *reading.get(Field::Pm10_0));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 545, *reading.get(Field::Co2));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 57, *reading.get(Field::Voc));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 1, *reading.get(Field::Nox));
  TEST_ASSERT_EQUAL_UINT32(0x1DE2F1, *reading.sequence);
  TEST_ASSERT_FALSE(reading.has(Field::AccelerationX));
  TEST_ASSERT_FALSE(reading.has(Field::Rssi));
}

void test_extended_bare_payload_matches_advertisement(void) {
  Reading from_payload, from_advertisement;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodeAdvertisement(extendedPayload(), from_payload));
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodeAdvertisement(bytesOf(kExtendedAdvertisement),
                                       from_advertisement));
  TEST_ASSERT_TRUE(from_payload == from_advertisement);
}

void test_extended_co2_sentinel_is_absent(void) {
  std::vector<uint8_t> payload = extendedPayload();
  payload[15] = 0xFF;
  payload[16] = 0xFF;

  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0xE1, reading));
  TEST_ASSERT_FALSE(reading.has(Field::Co2));
  TEST_ASSERT_TRUE(reading.has(Field::Temperature));
  TEST_ASSERT_TRUE(reading.has(Field::Pm2_5));
  TEST_ASSERT_TRUE(reading.has(Field::Voc));
}

void test_extended_index_low_bits(void) {
  std::vector<uint8_t> payload = extendedPayload();
  payload[17] = 0x40;
  payload[18] = 0x01;
  payload[28] = 0x38;

  Reading reading;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0xE1, reading));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 128, *reading.get(Field::Voc));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 2, *reading.get(Field::Nox));

  payload[28] = 0x78;
  TEST_ASSERT_TRUE(DecodeStatus::Ok ==
                   decodePayload(payload, 0xE1, reading));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 129, *reading.get(Field::Voc));
}

void test_truncated_payloads(void) {
  Reading reading;
  std::vector<uint8_t> rawv2 = bytesOf(kRawV2Valid);
  rawv2.pop_back();
  TEST_ASSERT_TRUE(DecodeStatus::TruncatedPayload ==
                   decodePayload(rawv2, 0x05, reading));

  std::vector<uint8_t> rawv1 = bytesOf(kRawV1Valid);
  rawv1.resize(5);
  TEST_ASSERT_TRUE(DecodeStatus::TruncatedPayload ==
                   decodePayload(rawv1, 0x03, reading));

  std::vector<uint8_t> format6 = format6Payload();
  TEST_ASSERT_EQUAL(20, format6.size());
  TEST_ASSERT_TRUE(DecodeStatus::Ok == decodePayload(format6, 0x06, reading));
  format6.resize(19);
  TEST_ASSERT_TRUE(DecodeStatus::TruncatedPayload ==
                   decodePayload(format6, 0x06, reading));

  rawv1 = bytesOf(kRawV1Valid);
  TEST_ASSERT_TRUE(DecodeStatus::Ok == decodePayload(rawv1, 0x03, reading));
  rawv1.resize(13);
  TEST_ASSERT_TRUE(DecodeStatus::TruncatedPayload ==
                   decodePayload(rawv1, 0x03, reading));

  std::vector<uint8_t> extended = extendedPayload();
  extended.resize(39);
  TEST_ASSERT_TRUE(DecodeStatus::TruncatedPayload ==
                   decodePayload(extended, 0xE1, reading));

  TEST_ASSERT_TRUE(DecodeStatus::TruncatedPayload ==
                   decodeAdvertisement({}, reading));
}

void test_unsupported_formats(void) {
  Reading reading;
  std::vector<uint8_t> payload(64, 0x00);
  TEST_ASSERT_TRUE(DecodeStatus::UnsupportedFormat ==
                   decodePayload(payload, 0x04, reading));
  TEST_ASSERT_TRUE(DecodeStatus::UnsupportedFormat ==
                   decodePayload(payload, 0x08, reading));
  TEST_ASSERT_TRUE(DecodeStatus::UnsupportedFormat ==
                   decodeAdvertisement({0x02, 0x01, 0x06}, reading));
  TEST_ASSERT_EQUAL(0, minimumPayloadLength(0x07));
  TEST_ASSERT_EQUAL(24, minimumPayloadLength(0x05));
}

void test_decoding_is_deterministic(void) {
  std::vector<uint8_t> payload = bytesOf(kRawV2Valid);
  Reading first, second;
  second.set(Field::Co2, 1234);
  second.sequence = 1;

  TEST_ASSERT_TRUE(DecodeStatus::Ok == decodePayload(payload, 0x05, first));
  TEST_ASSERT_TRUE(DecodeStatus::Ok == decodePayload(payload, 0x05, second));
  TEST_ASSERT_TRUE(first == second);
}

void test_hex_to_bytes(void) {
  std::vector<uint8_t> bytes;
  TEST_ASSERT_TRUE(hexToBytes("0aFF", bytes));
  TEST_ASSERT_EQUAL(2, bytes.size());
  TEST_ASSERT_EQUAL_HEX8(0x0A, bytes[0]);
  TEST_ASSERT_EQUAL_HEX8(0xFF, bytes[1]);
  TEST_ASSERT_FALSE(hexToBytes("ABC", bytes));
  TEST_ASSERT_FALSE(hexToBytes("ZZ", bytes));
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_rawv2_reference_vector);
  RUN_TEST(test_rawv2_temperature_scale);
  RUN_TEST(test_rawv2_temperature_sentinel_is_absent);
  RUN_TEST(test_rawv2_all_sentinels);
  RUN_TEST(test_rawv2_minimum_values_are_not_absent);
  RUN_TEST(test_rawv1_reference_vector);
  RUN_TEST(test_rawv1_pressure_and_negative_temperature);
  RUN_TEST(test_format6_payload);
  RUN_TEST(test_format6_index_sentinel);
  RUN_TEST(test_extended_advertisement);
  RUN_TEST(test_extended_bare_payload_matches_advertisement);
  RUN_TEST(test_extended_co2_sentinel_is_absent);
  RUN_TEST(test_extended_index_low_bits);
  RUN_TEST(test_truncated_payloads);
  RUN_TEST(test_unsupported_formats);
  RUN_TEST(test_decoding_is_deterministic);
  RUN_TEST(test_hex_to_bytes);
  return UNITY_END();
}
