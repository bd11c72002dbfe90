#pragma once
#include "core/telemetry.h"

// What a concrete device bridge must supply to the publish session.
class IDeviceBridge {
public:
  virtual ~IDeviceBridge() = default;

  // Payload for the status topic. online=false is used for the last-will and
  // the explicit offline message on clean shutdown.
  virtual StatusMessage status_message(bool online) = 0;

  // Collect one sample and publish it. Called once per scheduler tick.
  virtual void publish_data() = 0;
};
