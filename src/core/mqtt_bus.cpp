#define LOG_TAG "mqtt"
#include "core/mqtt_bus.h"

#include <utility>

#include "core/log.h"

MqttBus::MqttBus(const std::string& client_id) {
  // clean_session=true: nothing is queued for us across restarts.
  mosq_ = mosquitto_new(client_id.c_str(), true, this);
  if (!mosq_) {
    LOGE("mosquitto_new(%s) failed", client_id.c_str());
    return;
  }
  mosquitto_connect_callback_set(mosq_, &MqttBus::_on_connect_shim);
  mosquitto_disconnect_callback_set(mosq_, &MqttBus::_on_disconnect_shim);
  mosquitto_reconnect_delay_set(mosq_, 2, 60, true);
}

MqttBus::~MqttBus() {
  if (!mosq_) return;
  if (loop_running_) {
    mosquitto_loop_stop(mosq_, true);
  }
  mosquitto_destroy(mosq_);
}

void MqttBus::set_handlers(ConnectHandler on_connect, DisconnectHandler on_disconnect) {
  on_connect_ = std::move(on_connect);
  on_disconnect_ = std::move(on_disconnect);
}

void MqttBus::_on_connect_shim(struct mosquitto*, void* obj, int rc) {
  MqttBus* self = static_cast<MqttBus*>(obj);
  if (!self || !self->on_connect_) return;
  self->on_connect_(rc);
}

void MqttBus::_on_disconnect_shim(struct mosquitto*, void* obj, int rc) {
  MqttBus* self = static_cast<MqttBus*>(obj);
  if (!self || !self->on_disconnect_) return;
  self->on_disconnect_(rc);
}

bool MqttBus::set_last_will(const std::string& topic, const std::string& payload, int qos, bool retain) {
  if (!mosq_) return false;
  const int rc = mosquitto_will_set(mosq_, topic.c_str(), static_cast<int>(payload.size()), payload.data(),
                                    qos, retain);
  if (rc != MOSQ_ERR_SUCCESS) {
    LOGE("will_set(%s) failed: %s", topic.c_str(), mosquitto_strerror(rc));
    return false;
  }
  return true;
}

bool MqttBus::connect(const std::string& host, uint16_t port, uint16_t keepalive_s, const char** err) {
  if (!mosq_) {
    if (err) *err = "no_client";
    return false;
  }

  int rc = mosquitto_connect_async(mosq_, host.c_str(), port, keepalive_s);
  if (rc != MOSQ_ERR_SUCCESS) {
    // MOSQ_ERR_ERRNO leaves the real cause in errno; mosquitto_strerror covers the rest.
    if (err) *err = mosquitto_strerror(rc);
    return false;
  }

  if (!loop_running_) {
    rc = mosquitto_loop_start(mosq_);
    if (rc != MOSQ_ERR_SUCCESS) {
      if (err) *err = mosquitto_strerror(rc);
      return false;
    }
    loop_running_ = true;
  }
  return true;
}

bool MqttBus::publish(const std::string& topic, const std::string& payload, int qos, bool retain) {
  if (!mosq_) return false;
  const int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), qos, retain);
  if (rc != MOSQ_ERR_SUCCESS) {
    LOGD("mosquitto_publish %s: %s", topic.c_str(), mosquitto_strerror(rc));
    return false;
  }
  return true;
}

void MqttBus::disconnect() {
  if (!mosq_) return;
  const int rc = mosquitto_disconnect(mosq_);
  if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
    LOGW("disconnect: %s", mosquitto_strerror(rc));
  }
  if (loop_running_) {
    // Not forced: let the thread flush queued packets and the DISCONNECT first.
    mosquitto_loop_stop(mosq_, rc != MOSQ_ERR_SUCCESS);
    loop_running_ = false;
  }
}
