/*
 * main.cpp
 *
 *  Created on: 9 jan. 2026
 */

#include <chrono>
#include <csignal>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>

#include <mosquittopp.h>

#include "Config.hpp"
#include "JsonReading.hpp"
#include "SensorManager.hpp"
#include "mqtt.hpp"
#include "utils/logger.hpp"
#include "utils/splitString.hpp"

static volatile std::sig_atomic_t g_stop = 0;

static void signalHandler(int) { g_stop = 1; }

// Stores a saved Ruuvi Gateway /history response
static bool importHistory(const std::string &path, SensorManager &manager) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Cannot open gateway history %s", path.c_str());
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::vector<Reading> readings;
  if (!parseGatewayHistory(buffer.str(), readings))
    return false;

  size_t inserted = 0, duplicates = 0;
  for (auto &reading : readings) {
    IngestStatus status = manager.ingest(reading);
    if (status == IngestStatus::Inserted)
      inserted++;
    else if (status == IngestStatus::Duplicate)
      duplicates++;
  }
  LOG_INFO("Gateway history %s: %zu readings, %zu stored, %zu duplicates",
           path.c_str(), readings.size(), inserted, duplicates);
  return true;
}

int main(int argc, char *argv[]) {
  std::vector<std::string> arguments(argv + 1, argv + argc);
  auto options = parseKeyValue(arguments);

  std::string config_path = "ruuvi.json";
  if (options.count("config"))
    config_path = options["config"];

  Config config;
  if (!loadConfig(config_path, config))
    LOG_WARNING("Continuing with default configuration");
  if (options.count("database"))
    config.storage_path = options["database"];
  if (options.count("debug"))
    config.log_debug = options["debug"] != "0";

  utils::logger::set_log_file(config.log_file);
  utils::logger::set_debug(config.log_debug);

  SensorManager manager(config.storage_path, config.auto_point_budget);
  if (!manager.isReady()) {
    LOG_ERROR("Cannot open storage %s, exiting", config.storage_path.c_str());
    return 1;
  }
  if (!config.devices.empty()) {
    size_t stored = manager.importDevices(config.devices);
    LOG_INFO("Imported %zu of %zu configured devices", stored,
             config.devices.size());
  }

  if (options.count("history") && !importHistory(options["history"], manager))
    LOG_WARNING("Gateway history not imported");

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  mosqpp::lib_init();
  std::unique_ptr<MqttSubscriber> mqtt;
  if (config.mqtt.enabled) {
    mqtt = std::make_unique<MqttSubscriber>(config.mqtt, manager);
    if (!mqtt->start())
      LOG_ERROR("MQTT ingest not running");
  } else {
    LOG_INFO("MQTT ingest disabled");
  }

  int seconds = 0;
  while (!g_stop) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    if (++seconds % 300 == 0) {
      IngestStats stats = manager.stats();
      LOG_INFO("%llu stored, %llu duplicates, %llu rejected, %llu conflicts, "
               "%llu errors",
               (unsigned long long)stats.inserted,
               (unsigned long long)stats.duplicates,
               (unsigned long long)stats.rejected,
               (unsigned long long)stats.conflicts,
               (unsigned long long)stats.errors);
    }
  }

  LOG_INFO("Shutting down");
  if (mqtt)
    mqtt->stop();
  mqtt.reset();
  mosqpp::lib_cleanup();
  return 0;
}
