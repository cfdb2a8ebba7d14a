/*
 * mqtt.cpp
 *
 *  Created on: 9 jan. 2026
 */

#include "mqtt.hpp"

#include <chrono>
#include <thread>

#include "JsonReading.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

MqttSubscriber::MqttSubscriber(const MqttConfig &config,
                               SensorManager &manager)
    : mosqpp::mosquittopp(config.client_id.c_str()), mConfig(config),
      mManager(manager) {}

MqttSubscriber::~MqttSubscriber() { stop(); }

bool MqttSubscriber::start(void) {
  if (mRunning)
    return true;

  if (!mConfig.username.empty()) {
    int result = username_pw_set(mConfig.username.c_str(),
                                 mConfig.password.c_str());
    if (result != MOSQ_ERR_SUCCESS) {
      LOG_ERROR("Setting MQTT credentials failed: %s",
                mosqpp::strerror(result));
      return false;
    }
  }
  reconnect_delay_set(1, 60, true);

  int result = connect_async(mConfig.broker.c_str(), mConfig.port);
  if (result != MOSQ_ERR_SUCCESS) {
    LOG_ERROR("MQTT connect to %s:%d failed: %s", mConfig.broker.c_str(),
              mConfig.port, mosqpp::strerror(result));
    return false;
  }
  result = loop_start();
  if (result != MOSQ_ERR_SUCCESS) {
    LOG_ERROR("MQTT network thread failed to start: %s",
              mosqpp::strerror(result));
    return false;
  }
  mRunning = true;
  LOG_INFO("MQTT subscriber connecting to %s:%d", mConfig.broker.c_str(),
           mConfig.port);
  return true;
}

void MqttSubscriber::stop(void) {
  if (!mRunning.exchange(false))
    return;
  disconnect();
  int result = loop_stop();
  if (result != MOSQ_ERR_SUCCESS)
    LOG_WARNING("MQTT network thread did not stop cleanly: %s",
                mosqpp::strerror(result));
  MqttStats s = stats();
  LOG_INFO("MQTT subscriber stopped, %llu received, %llu stored, %llu "
           "duplicates, %llu errors",
           (unsigned long long)s.received, (unsigned long long)s.stored,
           (unsigned long long)s.duplicates, (unsigned long long)s.errors);
}

void MqttSubscriber::on_connect(int rc) {
  if (rc) {
    LOG_ERROR("MQTT connection refused: %s", mosqpp::connack_string(rc));
    return;
  }
  int mid;
  int result = subscribe(&mid, mConfig.topic.c_str(), 1);
  LOG_INFO("Connected to %s, subscribe %s mid %d status %d",
           mConfig.broker.c_str(), mConfig.topic.c_str(), mid, result);
}

void MqttSubscriber::on_disconnect(int rc) {
  // Unexpected disconnects are retried by the network thread
  if (rc)
    LOG_WARNING("MQTT connection lost: %s", mosqpp::strerror(rc));
  else
    LOG_INFO(__FUNCTION__);
}

void MqttSubscriber::on_message(const struct mosquitto_message *message) {
  mReceived++;

  if (message->payloadlen > kMaxPayload) {
    LOG_WARNING("Payload too large %d > %d", message->payloadlen, kMaxPayload);
    mErrors++;
    return;
  }
  std::string payload((const char *)message->payload, message->payloadlen);
  handleMessage(message->topic, payload);
}

IngestStatus MqttSubscriber::handleMessage(const std::string &topic,
                                           const std::string &payload) {
  LOG_DEBUG("Topic : %s", topic.c_str());
  LOG_DEBUG("Payload : %s", payload.c_str());

  Reading reading;
  if (!parseMqttMessage(topic, payload, getUnixTime(), reading)) {
    mErrors++;
    return IngestStatus::DecodeError;
  }
  if (utils::logger::debug_enabled())
    LOG_DEBUG("Reading : %s", readingToJson(reading).dump().c_str());

  IngestStatus status = mManager.ingest(reading);
  // An insert is idempotent, so a busy database is simply tried again
  for (int retry = 0;
       status == IngestStatus::StorageBusy && retry < kBusyRetries; retry++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    status = mManager.ingest(reading);
  }

  switch (status) {
  case IngestStatus::Inserted:
    mStored++;
    break;
  case IngestStatus::Duplicate:
    mDuplicates++;
    break;
  default:
    LOG_WARNING("Reading from %s not stored: %s", reading.device_id.c_str(),
                ingestStatusName(status));
    mErrors++;
    break;
  }
  return status;
}

void MqttSubscriber::on_subscribe(int mid, int qos_count,
                                  const int *granted_qos) {
  LOG_INFO("Subscribed, mid %d granted qos %d", mid,
           qos_count ? granted_qos[0] : -1);
}

void MqttSubscriber::on_log(int level, const char *str) {
  LOG_DEBUG("mosquitto: %s", str);
}

void MqttSubscriber::on_error() { LOG_ERROR(__FUNCTION__); }

MqttStats MqttSubscriber::stats(void) const {
  MqttStats stats;
  stats.received = mReceived;
  stats.stored = mStored;
  stats.duplicates = mDuplicates;
  stats.errors = mErrors;
  return stats;
}
