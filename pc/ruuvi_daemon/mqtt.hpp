/*
 * mqtt.hpp
 *
 *  Created on: 9 jan. 2026
 */

#ifndef MQTT_HPP_
#define MQTT_HPP_

#include <atomic>
#include <string>

#include <stdint.h>

#include <mosquittopp.h>

#include "Config.hpp"
#include "SensorManager.hpp"

struct MqttStats {
  uint64_t received = 0;
  uint64_t stored = 0;
  uint64_t duplicates = 0;
  uint64_t errors = 0;
};

// Feeds Ruuvi Gateway MQTT messages into the sensor manager
class MqttSubscriber : public mosqpp::mosquittopp {
public:
  MqttSubscriber(const MqttConfig &config, SensorManager &manager);
  ~MqttSubscriber();

  // Starts the network thread, connecting happens in the background
  bool start(void);
  void stop(void);

  void on_connect(int rc) override;
  void on_disconnect(int rc) override;
  void on_message(const struct mosquitto_message *message) override;
  void on_subscribe(int mid, int qos_count, const int *granted_qos) override;
  void on_log(int level, const char *str) override;
  void on_error() override;

  // Decodes and stores one message, used by on_message
  IngestStatus handleMessage(const std::string &topic,
                             const std::string &payload);

  MqttStats stats(void) const;

private:
  MqttConfig mConfig;
  SensorManager &mManager;
  std::atomic<bool> mRunning{false};

  std::atomic<uint64_t> mReceived{0};
  std::atomic<uint64_t> mStored{0};
  std::atomic<uint64_t> mDuplicates{0};
  std::atomic<uint64_t> mErrors{0};

  static const int kMaxPayload = 4096;
  static const int kBusyRetries = 3;
};

#endif /* MQTT_HPP_ */
