#define LOG_TAG "main"
#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>

#include <utility>

#include "app/app_config.h"
#include "app/cli_options.h"
#include "app/renogy_bridge.h"
#include "components/modbus_rtu_link.h"
#include "components/udev_port_enumerator.h"
#include "core/address_probe.h"
#include "core/device_session.h"
#include "core/log.h"
#include "core/mqtt_bus.h"
#include "core/publish_session.h"
#include "core/scheduler.h"
#include "core/serial_port_finder.h"

// -------------------------------------------------------------------------------------------------
// Signal handling
// -------------------------------------------------------------------------------------------------
static Scheduler* g_scheduler = nullptr;

static void on_stop_signal(int /*signo*/)
{
  // Only the atomic store; logging happens once run() returns.
  if (g_scheduler) g_scheduler->request_stop();
}

static bool install_stop_handlers()
{
  struct sigaction sa {};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: nanosleep must return on EINTR

  if (sigaction(SIGINT, &sa, nullptr) != 0) return false;
  if (sigaction(SIGTERM, &sa, nullptr) != 0) return false;
  return true;
}

// -------------------------------------------------------------------------------------------------
// Serial bus bring-up
// -------------------------------------------------------------------------------------------------
static bool resolve_port_path(BridgeOptions& opts)
{
  if (!opts.port_path.empty()) return true;

  UdevPortEnumerator ports;
  Fault fault;
  if (!find_usb_serial_port(ports, USB_SERIAL_DEFAULTS, &opts.port_path, &fault)) {
    LOGE("serial port detection failed: %s %s", to_str(fault.kind), fault.reason);
    return false;
  }
  return true;
}

static bool select_controller(ModbusRtuLink& link, const BridgeOptions& opts)
{
  if (opts.slave_address > 0) {
    if (!link.select_unit(static_cast<uint8_t>(opts.slave_address))) {
      LOGE("cannot select unit %d", opts.slave_address);
      return false;
    }
    LOGI("using unit %d", opts.slave_address);
    return true;
  }

  ProbeRange range;
  range.first = SERIAL_DEFAULTS.unit_id_min;
  range.last = SERIAL_DEFAULTS.unit_id_max;
  range.timeout_ms = SERIAL_DEFAULTS.probe_timeout_ms;

  uint8_t found = 0;
  Fault fault;
  if (!probe_unit_address(link, range, &found, &fault)) {
    LOGE("unit scan failed: %s %s", to_str(fault.kind), fault.reason);
    return false;
  }
  LOGI("found controller at unit %u", static_cast<unsigned>(found));
  return true;
}

// -------------------------------------------------------------------------------------------------
// Entry point
// -------------------------------------------------------------------------------------------------
int main(int argc, char** argv)
{
  BridgeOptions opts;
  const char* usage_err = "";
  switch (parse_options(argc, argv, &opts, &usage_err)) {
    case ParseResult::OK:
      break;
    case ParseResult::HELP:
      print_usage(stdout, argv[0]);
      return 0;
    case ParseResult::USAGE_ERROR:
    default:
      fprintf(stderr, "%s: %s\n", argv[0], usage_err);
      print_usage(stderr, argv[0]);
      return 2;
  }

  Log::set_level(opts.verbose ? LogLevel::DEBUG : LogLevel::INFO);
  LOGI("%s schema v%d starting, client %s", BRIDGE_FW_NAME, RENOGY_BRIDGE_SCHEMA_V, opts.name.c_str());

  MosquittoLibrary mosquitto_lib;

  if (!resolve_port_path(opts)) return 1;

  SerialLinkConfig serial_cfg;
  serial_cfg.device = opts.port_path;
  serial_cfg.baud = opts.baud;
  serial_cfg.parity = SERIAL_DEFAULTS.parity;
  serial_cfg.data_bits = SERIAL_DEFAULTS.data_bits;
  serial_cfg.stop_bits = SERIAL_DEFAULTS.stop_bits;
  serial_cfg.response_timeout_ms = opts.timeout_ms;

  ModbusRtuLink link(std::move(serial_cfg));
  const char* err = "";
  if (!link.open(&err)) {
    LOGE("cannot open %s: %s", opts.port_path.c_str(), err);
    return 1;
  }
  if (!select_controller(link, opts)) return 1;

  DeviceSession device(link);
  MqttBus mqtt(opts.name);
  if (!mqtt.valid()) {
    LOGE("cannot create MQTT client");
    return 1;
  }

  SessionConfig session_cfg;
  session_cfg.host = opts.broker;
  session_cfg.port = opts.port;
  session_cfg.keepalive_s = opts.keepalive_s;
  session_cfg.client_name = opts.name;
  session_cfg.domain = opts.domain;
  session_cfg.data_qos = opts.qos;

  RenogyBridge bridge(device, mqtt, std::move(session_cfg));

  SystemClock clock;
  Scheduler scheduler(clock, opts.publish_interval_s * 1000u);
  g_scheduler = &scheduler;
  if (!install_stop_handlers()) {
    LOGE("sigaction: %s", strerror(errno));
    return 1;
  }

  int rc = 0;
  {
    ScopedConnection connection(bridge.session());
    if (!connection.started()) {
      rc = 1;
    } else if (!bridge.session().wait_connected(opts.connect_timeout_s * 1000u)) {
      LOGE("broker %s:%u not reachable within %u s", opts.broker.c_str(), static_cast<unsigned>(opts.port),
           opts.connect_timeout_s);
      rc = 1;
    } else {
      scheduler.run([&bridge] { bridge.publish_data(); });
      LOGI("interrupted, %u samples published, %u dropped", bridge.samples_published(), bridge.samples_dropped());
    }
  }

  g_scheduler = nullptr;
  LOGI("%u failed register reads", device.failed_reads());
  return rc;
}
