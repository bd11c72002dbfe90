#define LOG_TAG "bridge"
#include "app/renogy_bridge.h"

#include <utility>

#include "app/app_config.h"
#include "core/log.h"

RenogyBridge::RenogyBridge(DeviceSession& device, IMqttTransport& mqtt, SessionConfig cfg)
  : device_(device), session_(mqtt, std::move(cfg), *this) {}

const DeviceIdentity& RenogyBridge::identity() {
  // Re-read until every identity field has come back once.
  if (identity_.entries.size() < IDENTITY_FIELD_COUNT) {
    DeviceIdentity fresh = device_.get_identity();
    if (fresh.entries.size() >= identity_.entries.size()) identity_ = std::move(fresh);
    if (const IdentityEntry* model = identity_.find("model")) {
      LOGI("controller %s, %zu of %zu identity fields", model->text.c_str(), identity_.entries.size(),
           IDENTITY_FIELD_COUNT);
    }
  }
  return identity_;
}

StatusMessage RenogyBridge::status_message(bool online) {
  StatusMessage msg;
  msg.client = session_.config().client_name;
  msg.online = online;
  msg.identity = identity();
  return msg;
}

void RenogyBridge::publish_data() {
  const TelemetryRecord record = device_.get_data();
  if (record.empty()) {
    samples_dropped_++;
    LOGW("no field could be read, sample dropped");
    return;
  }

  if (session_.publish_data(record)) {
    samples_published_++;
    LOGI("published %zu fields to %s", record.size(), session_.data_topic().c_str());
  } else {
    samples_dropped_++;
  }
}
