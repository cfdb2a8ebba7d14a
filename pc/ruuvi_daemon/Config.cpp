/*
 * Config.cpp
 *
 *  Created on: 7 jan. 2026
 */

#include "Config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

bool parseConfig(const std::string &text, Config &config) {
  nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    LOG_ERROR("Configuration is not a JSON object");
    return false;
  }

  Config parsed = config;
  try {
    if (json.contains("storage")) {
      auto &storage = json["storage"];
      parsed.storage_path = storage.value("path", parsed.storage_path);
    }

    if (json.contains("mqtt")) {
      auto &mqtt = json["mqtt"];
      parsed.mqtt.enabled = mqtt.value("enabled", true);
      parsed.mqtt.broker = mqtt.value("broker", parsed.mqtt.broker);
      parsed.mqtt.port = mqtt.value("port", parsed.mqtt.port);
      parsed.mqtt.topic = mqtt.value("topic", parsed.mqtt.topic);
      parsed.mqtt.username = mqtt.value("username", parsed.mqtt.username);
      parsed.mqtt.password = mqtt.value("password", parsed.mqtt.password);
      parsed.mqtt.client_id = mqtt.value("client_id", parsed.mqtt.client_id);
    }

    if (json.contains("query")) {
      auto &query = json["query"];
      parsed.auto_point_budget =
          query.value("auto_point_budget", parsed.auto_point_budget);
      if (!parsed.auto_point_budget) {
        LOG_WARNING("auto_point_budget must be positive, using %zu",
                    kDefaultPointBudget);
        parsed.auto_point_budget = kDefaultPointBudget;
      }
    }

    if (json.contains("log")) {
      auto &log = json["log"];
      parsed.log_file = log.value("file", parsed.log_file);
      parsed.log_debug = log.value("debug", parsed.log_debug);
    }

    if (json.contains("devices")) {
      parsed.devices.clear();
      for (auto &entry : json["devices"]) {
        Device device;
        device.mac = normalizeDeviceId(entry.value("mac", ""));
        std::string type = entry.value("type", "");
        if (device.mac.empty()) {
          LOG_WARNING("Ignoring configured device without mac");
          continue;
        }
        if (!parseSensorType(type, device.sensor_type)) {
          LOG_WARNING("Ignoring configured device %s, type '%s' is not tag "
                      "or air",
                      device.mac.c_str(), type.c_str());
          continue;
        }
        device.nickname = entry.value("nickname", "");
        device.description = entry.value("description", "");
        device.ble_uuid = entry.value("ble_uuid", "");
        parsed.devices.push_back(device);
      }
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("Invalid configuration: %s", e.what());
    return false;
  }

  config = parsed;
  return true;
}

bool loadConfig(const std::string &path, Config &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_WARNING("Configuration %s not found, using defaults", path.c_str());
    return true;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!parseConfig(buffer.str(), config)) {
    LOG_ERROR("Failed to load configuration %s", path.c_str());
    return false;
  }
  LOG_INFO("Configuration loaded from %s", path.c_str());
  return true;
}
