#pragma once
#include <stdint.h>

#include <functional>
#include <string>

// The broker connection as the session needs it. Implementations own the
// socket, keepalive and network thread; handlers may fire on that thread.
class IMqttTransport {
public:
  // rc == 0 means accepted (CONNACK) / clean disconnect.
  using ConnectHandler = std::function<void(int rc)>;
  using DisconnectHandler = std::function<void(int rc)>;

  virtual ~IMqttTransport() = default;

  virtual void set_handlers(ConnectHandler on_connect, DisconnectHandler on_disconnect) = 0;

  // Must be called before connect(); the broker captures the will at CONNECT.
  virtual bool set_last_will(const std::string& topic, const std::string& payload, int qos, bool retain) = 0;

  // Starts an asynchronous connect; the outcome arrives via the connect handler.
  virtual bool connect(const std::string& host, uint16_t port, uint16_t keepalive_s, const char** err) = 0;

  virtual bool publish(const std::string& topic, const std::string& payload, int qos, bool retain) = 0;

  // Clean DISCONNECT, then stops the network thread. The will is discarded.
  virtual void disconnect() = 0;
};
