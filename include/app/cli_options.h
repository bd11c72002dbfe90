#pragma once
#include <stdint.h>
#include <stdio.h>

#include <string>

#include "app/app_config.h"

struct BridgeOptions {
  std::string broker;
  uint16_t port {MQTT_DEFAULTS.broker_port};
  std::string name;
  std::string domain {MQTT_DEFAULTS.domain};
  std::string port_path;
  uint32_t baud {SERIAL_DEFAULTS.baud};
  int slave_address {-1}; // -1: probe the bus
  uint32_t publish_interval_s {SCHEDULE_DEFAULTS.publish_interval_s};
  uint8_t qos {MQTT_DEFAULTS.data_qos};
  uint16_t keepalive_s {MQTT_DEFAULTS.keepalive_s};
  uint32_t timeout_ms {SERIAL_DEFAULTS.response_timeout_ms};
  uint32_t connect_timeout_s {MQTT_DEFAULTS.connect_timeout_s};
  bool verbose {false};
};

enum class ParseResult : uint8_t { OK = 0, HELP = 1, USAGE_ERROR = 2 };

// On USAGE_ERROR *err names the offending option (static storage).
ParseResult parse_options(int argc, char** argv, BridgeOptions* out, const char** err);

void print_usage(FILE* f, const char* prog);
