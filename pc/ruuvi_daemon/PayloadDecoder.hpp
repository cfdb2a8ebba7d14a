/*
 * PayloadDecoder.hpp
 *
 *  Created on: 3 jan. 2026
 */

#ifndef PAYLOADDECODER_HPP_
#define PAYLOADDECODER_HPP_

#include <string>
#include <vector>

#include <stddef.h>
#include <stdint.h>

#include "Reading.hpp"

enum class DecodeStatus {
  Ok,
  TruncatedPayload,
  UnsupportedFormat,
};

const char *decodeStatusName(DecodeStatus status);

// Smallest payload, format byte included, accepted for a format.
// Returns 0 for an unknown format code.
size_t minimumPayloadLength(uint8_t format_code);

/*
 * Decodes one Ruuvi manufacturer data payload. Byte 0 of the payload is the
 * format byte, all layout offsets count from there. Fills the physical
 * fields, sensor_type, format and sequence of the reading. The device_id is
 * only set when the format carries the full MAC address; the timestamp is
 * left alone, the transport knows when the broadcast was received.
 *
 * Pure: no I/O, no state, the same bytes always give the same reading.
 */
DecodeStatus decodePayload(const uint8_t *payload, size_t size,
                           uint8_t format_code, Reading &reading);
DecodeStatus decodePayload(const std::vector<uint8_t> &payload,
                           uint8_t format_code, Reading &reading);

// A full advertisement (AD structures containing FF 99 04) or a bare payload
DecodeStatus decodeAdvertisement(const std::vector<uint8_t> &data,
                                 Reading &reading);

bool hexToBytes(const std::string &hex, std::vector<uint8_t> &bytes);

#endif /* PAYLOADDECODER_HPP_ */
