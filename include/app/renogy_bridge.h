#pragma once
#include <stdint.h>

#include "core/device_bridge.h"
#include "core/device_session.h"
#include "core/mqtt_transport.h"
#include "core/publish_session.h"

// Composition root: Renogy register reads in, MQTT status/data out.
class RenogyBridge : public IDeviceBridge {
public:
  RenogyBridge(DeviceSession& device, IMqttTransport& mqtt, SessionConfig cfg);

  StatusMessage status_message(bool online) override;
  void publish_data() override;

  PublishSession& session() { return session_; }
  const PublishSession& session() const { return session_; }

  uint32_t samples_published() const { return samples_published_; }
  uint32_t samples_dropped() const { return samples_dropped_; }

private:
  const DeviceIdentity& identity();

  DeviceSession& device_;
  PublishSession session_;

  // Identity registers are static; read once, retried only while empty.
  DeviceIdentity identity_ {};

  uint32_t samples_published_ {0};
  uint32_t samples_dropped_ {0};
};
