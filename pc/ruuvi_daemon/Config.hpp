/*
 * Config.hpp
 *
 *  Created on: 7 jan. 2026
 */

#ifndef CONFIG_HPP_
#define CONFIG_HPP_

#include <string>
#include <vector>

#include "DeviceRegistry.hpp"
#include "Resolution.hpp"

struct MqttConfig {
  bool enabled = false; // true as soon as the file has an mqtt section
  std::string broker = "localhost";
  int port = 1883;
  std::string topic = "ruuvi/#";
  std::string username;
  std::string password;
  std::string client_id = "ruuvi-daemon";
};

struct Config {
  std::string storage_path = "data/readings.db";
  MqttConfig mqtt;
  size_t auto_point_budget = kDefaultPointBudget;
  std::string log_file = "ruuvi_daemon.log";
  bool log_debug = false;
  std::vector<Device> devices;
};

// Missing keys keep their default. Returns false, with config untouched,
// for malformed input.
bool parseConfig(const std::string &text, Config &config);

// A missing file is not an error, the defaults are used
bool loadConfig(const std::string &path, Config &config);

#endif /* CONFIG_HPP_ */
