#define LOG_TAG "mqtt"
#include "core/publish_session.h"

#include <chrono>
#include <utility>

#include "app/app_config.h"
#include "core/log.h"
#include "core/publishers.h"

PublishSession::PublishSession(IMqttTransport& transport, SessionConfig cfg, IDeviceBridge& bridge)
  : transport_(transport),
    cfg_(std::move(cfg)),
    bridge_(bridge),
    base_topic_(cfg_.domain + "/" + cfg_.client_name),
    status_topic_(base_topic_ + "/" + STATUS_SUBTOPIC),
    data_topic_(base_topic_ + "/" + DATA_SUBTOPIC) {
  transport_.set_handlers([this](int rc) { handle_connect(rc); },
                          [this](int rc) { handle_disconnect(rc); });
}

void PublishSession::set_state(ConnectionState s) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.store(s);
  }
  state_cv_.notify_all();
}

bool PublishSession::connect() {
  const ConnectionState s = state();
  if (s == ConnectionState::CONNECTED) {
    LOGW("already connected to %s:%u", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port));
    return true;
  }
  if (s == ConnectionState::CONNECTING) {
    LOGW("connect to %s:%u already in progress", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port));
    return true;
  }

  offline_payload_ = publishers::status_payload(bridge_.status_message(false));
  birth_payload_ = publishers::status_payload(bridge_.status_message(true));

  // The broker captures the will from CONNECT, so it has to be in place first.
  if (!transport_.set_last_will(status_topic_, offline_payload_, STATUS_QOS, true)) {
    LOGE("could not register last will on %s", status_topic_.c_str());
    return false;
  }

  // CONNECTING before the call: the ack may arrive on the network thread
  // before connect() returns.
  set_state(ConnectionState::CONNECTING);

  const char* err = nullptr;
  if (!transport_.connect(cfg_.host, cfg_.port, cfg_.keepalive_s, &err)) {
    LOGE("connect to %s:%u failed: %s", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port),
         err ? err : "unknown");
    set_state(ConnectionState::DISCONNECTED);
    return false;
  }

  loop_started_ = true;
  LOGI("connecting to %s:%u as %s (keepalive %us)", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port),
       cfg_.client_name.c_str(), static_cast<unsigned>(cfg_.keepalive_s));
  return true;
}

void PublishSession::handle_connect(int rc) {
  if (rc != 0) {
    LOGE("broker %s:%u refused connection rc=%d", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port), rc);
    set_state(ConnectionState::DISCONNECTED);
    return;
  }

  // Birth goes out before the state flips, so no data message can overtake it.
  if (!transport_.publish(status_topic_, birth_payload_, STATUS_QOS, true)) {
    LOGE("birth message on %s failed", status_topic_.c_str());
  }

  set_state(ConnectionState::CONNECTED);
  LOGI("connected to %s:%u, online on %s", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port),
       status_topic_.c_str());
}

void PublishSession::handle_disconnect(int rc) {
  // An unexpected loss of a live connection is retried by the network loop,
  // so the session waits for the next ack in CONNECTING.
  if (rc != 0 && state() == ConnectionState::CONNECTED) {
    set_state(ConnectionState::CONNECTING);
  } else {
    set_state(ConnectionState::DISCONNECTED);
  }
  if (rc == 0) {
    LOGI("disconnected from %s:%u", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port));
  } else {
    LOGW("connection to %s:%u lost rc=%d, reconnecting", cfg_.host.c_str(), static_cast<unsigned>(cfg_.port), rc);
  }
}

void PublishSession::disconnect() {
  if (!loop_started_) {
    set_state(ConnectionState::DISCONNECTED);
    return;
  }

  if (connected()) {
    // Same payload as the will: observers see one offline state either way.
    if (!transport_.publish(status_topic_, offline_payload_, STATUS_QOS, true)) {
      LOGW("offline status on %s failed", status_topic_.c_str());
    }
  }

  transport_.disconnect();
  loop_started_ = false;
  set_state(ConnectionState::DISCONNECTED);
}

bool PublishSession::publish(const std::string& payload, const std::string& subtopic, int qos, bool retain) {
  const std::string topic = base_topic_ + "/" + subtopic;
  if (!connected()) {
    LOGE("cannot publish to %s: not connected", topic.c_str());
    return false;
  }

  if (!transport_.publish(topic, payload, qos, retain)) {
    LOGE("publish to %s failed", topic.c_str());
    return false;
  }
  LOGD("published %zu bytes to %s", payload.size(), topic.c_str());
  return true;
}

bool PublishSession::publish_data(const TelemetryRecord& record) {
  return publish(publishers::telemetry_payload(record), DATA_SUBTOPIC, cfg_.data_qos, false);
}

bool PublishSession::wait_connected(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return state_.load() != ConnectionState::CONNECTING; });
  return state_.load() == ConnectionState::CONNECTED;
}
