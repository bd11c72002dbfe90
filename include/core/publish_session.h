#pragma once
#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

#include "config/bridge_defaults.h"
#include "core/device_bridge.h"
#include "core/mqtt_transport.h"
#include "core/telemetry.h"

enum class ConnectionState : uint8_t {
  DISCONNECTED = 0,
  CONNECTING   = 1,
  CONNECTED    = 2
};

inline const char* to_str(ConnectionState s) {
  switch (s) {
    case ConnectionState::DISCONNECTED: return "DISCONNECTED";
    case ConnectionState::CONNECTING:   return "CONNECTING";
    case ConnectionState::CONNECTED:    return "CONNECTED";
    default: return "UNKNOWN";
  }
}

struct SessionConfig {
  std::string host;
  uint16_t port {1883};
  uint16_t keepalive_s {60};
  std::string client_name;
  std::string domain {"solar"};
  uint8_t data_qos {0}; // at most once
};

// One broker connection: will/birth lifecycle, topic namespace and QoS policy.
//
// Topics: <domain>/<client>/status (qos 1, retained) and <domain>/<client>/data
// (configured qos, not retained). Nothing is queued while disconnected.
class PublishSession {
public:
  static constexpr int STATUS_QOS = BRIDGE_MQTT_DEFAULTS.status_qos;

  // bridge is only called from connect(), never from the constructor.
  PublishSession(IMqttTransport& transport, SessionConfig cfg, IDeviceBridge& bridge);

  PublishSession(const PublishSession&) = delete;
  PublishSession& operator=(const PublishSession&) = delete;

  // Registers the will, then starts the transport connect. Returns false when
  // the attempt could not be started; the session is DISCONNECTED again.
  bool connect();

  // Offline status (if connected), clean DISCONNECT, network loop stopped.
  void disconnect();

  // subtopic is relative to base_topic(). Dropped with one error log unless CONNECTED.
  bool publish(const std::string& payload, const std::string& subtopic, int qos, bool retain);
  bool publish_data(const TelemetryRecord& record);

  // Blocks until CONNECTED; false on timeout or a rejected attempt.
  bool wait_connected(uint32_t timeout_ms);

  ConnectionState state() const { return state_.load(); }
  bool connected() const { return state() == ConnectionState::CONNECTED; }

  const std::string& base_topic() const { return base_topic_; }
  const std::string& status_topic() const { return status_topic_; }
  const std::string& data_topic() const { return data_topic_; }
  const SessionConfig& config() const { return cfg_; }

private:
  void handle_connect(int rc);
  void handle_disconnect(int rc);
  void set_state(ConnectionState s);

  IMqttTransport& transport_;
  const SessionConfig cfg_;
  IDeviceBridge& bridge_;

  const std::string base_topic_;
  const std::string status_topic_;
  const std::string data_topic_;

  // Built on the caller's thread in connect(); the network thread only reads them.
  std::string birth_payload_;
  std::string offline_payload_;
  bool loop_started_ {false};

  std::atomic<ConnectionState> state_ {ConnectionState::DISCONNECTED};
  std::mutex state_mutex_;
  std::condition_variable state_cv_;
};

// Pairs connect() with disconnect() on every exit path of the owning scope.
class ScopedConnection {
public:
  explicit ScopedConnection(PublishSession& session) : session_(session), started_(session.connect()) {}
  ~ScopedConnection() { session_.disconnect(); }

  ScopedConnection(const ScopedConnection&) = delete;
  ScopedConnection& operator=(const ScopedConnection&) = delete;

  bool started() const { return started_; }

private:
  PublishSession& session_;
  bool started_;
};
