/*
 * JsonReading.hpp
 *
 *  Created on: 7 jan. 2026
 */

#ifndef JSONREADING_HPP_
#define JSONREADING_HPP_

#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include <nlohmann/json.hpp>

#include "Reading.hpp"

// Decodes a hex advertisement or payload. A MAC carried by the payload wins
// over device_id.
bool readingFromRawHex(const std::string &device_id, const std::string &hex,
                       int64_t timestamp, std::optional<double> rssi,
                       Reading &reading);

/*
 * Ruuvi Gateway MQTT message:
 * {"gw_mac": "..", "rssi": -36, "data": "2BFF9904E1..", "ts": "1735664400"}
 *
 * ts may be epoch seconds, as number or string, or ISO-8601. Without ts the
 * message is stamped with now. The last topic segment is the device id for
 * payloads that carry no MAC.
 */
bool parseMqttMessage(const std::string &topic, const std::string &payload,
                      int64_t now, Reading &reading);

// Ruuvi Gateway /history body, {"data": {"tags": {"<mac>": {...}}}}.
// Records that can not be typed are skipped. False only for a malformed body.
bool parseGatewayHistory(const std::string &body,
                         std::vector<Reading> &readings);

nlohmann::json readingToJson(const Reading &reading);

#endif /* JSONREADING_HPP_ */
