#pragma once
#include <stdint.h>

#include <string>

#include <mosquitto.h>

#include "core/mqtt_transport.h"

// Keeps libmosquitto initialised for the lifetime of the process.
class MosquittoLibrary {
public:
  MosquittoLibrary() { mosquitto_lib_init(); }
  ~MosquittoLibrary() { mosquitto_lib_cleanup(); }

  MosquittoLibrary(const MosquittoLibrary&) = delete;
  MosquittoLibrary& operator=(const MosquittoLibrary&) = delete;
};

// libmosquitto client with its own network thread (loop_start).
class MqttBus : public IMqttTransport {
public:
  explicit MqttBus(const std::string& client_id);
  ~MqttBus() override;

  MqttBus(const MqttBus&) = delete;
  MqttBus& operator=(const MqttBus&) = delete;

  bool valid() const { return mosq_ != nullptr; }

  void set_handlers(ConnectHandler on_connect, DisconnectHandler on_disconnect) override;
  bool set_last_will(const std::string& topic, const std::string& payload, int qos, bool retain) override;
  bool connect(const std::string& host, uint16_t port, uint16_t keepalive_s, const char** err) override;
  bool publish(const std::string& topic, const std::string& payload, int qos, bool retain) override;
  void disconnect() override;

private:
  static void _on_connect_shim(struct mosquitto* mosq, void* obj, int rc);
  static void _on_disconnect_shim(struct mosquitto* mosq, void* obj, int rc);

  struct mosquitto* mosq_ {nullptr};
  bool loop_running_ {false};
  ConnectHandler on_connect_ {};
  DisconnectHandler on_disconnect_ {};
};
