#include "app/cli_options.h"

#include <errno.h>
#include <getopt.h>
#include <stdlib.h>

#include <utility>

namespace {

enum OptionId : int {
  OPT_BROKER = 1000,
  OPT_PORT,
  OPT_NAME,
  OPT_DOMAIN,
  OPT_PORT_PATH,
  OPT_BAUD,
  OPT_SLAVE_ADDRESS,
  OPT_PUBLISH_FREQUENCY,
  OPT_QOS,
  OPT_KEEPALIVE,
  OPT_TIMEOUT_MS,
  OPT_CONNECT_TIMEOUT,
};

const struct option kLongOptions[] = {
  {"broker", required_argument, nullptr, OPT_BROKER},
  {"port", required_argument, nullptr, OPT_PORT},
  {"name", required_argument, nullptr, OPT_NAME},
  {"domain", required_argument, nullptr, OPT_DOMAIN},
  {"port-path", required_argument, nullptr, OPT_PORT_PATH},
  {"baud", required_argument, nullptr, OPT_BAUD},
  {"slave-address", required_argument, nullptr, OPT_SLAVE_ADDRESS},
  {"publish-frequency", required_argument, nullptr, OPT_PUBLISH_FREQUENCY},
  {"qos", required_argument, nullptr, OPT_QOS},
  {"keepalive", required_argument, nullptr, OPT_KEEPALIVE},
  {"timeout-ms", required_argument, nullptr, OPT_TIMEOUT_MS},
  {"connect-timeout", required_argument, nullptr, OPT_CONNECT_TIMEOUT},
  {"verbose", no_argument, nullptr, 'v'},
  {"help", no_argument, nullptr, 'h'},
  {nullptr, 0, nullptr, 0},
};

bool parse_uint(const char* s, unsigned long min, unsigned long max, unsigned long* out) {
  if (!s || *s == '\0' || *s == '-') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long v = strtoul(s, &end, 10);
  if (errno != 0 || !end || *end != '\0') return false;
  if (v < min || v > max) return false;
  *out = v;
  return true;
}

// Topic segments must not carry MQTT wildcards or separators.
bool valid_topic_segment(const std::string& s) {
  if (s.empty()) return false;
  return s.find_first_of("/+#") == std::string::npos;
}

} // namespace

ParseResult parse_options(int argc, char** argv, BridgeOptions* out, const char** err) {
  BridgeOptions opts;
  unsigned long v = 0;

  optind = 0; // full rescan, parse_options may run more than once per process
  opterr = 0;
  for (;;) {
    const int c = getopt_long(argc, argv, "vh", kLongOptions, nullptr);
    if (c == -1) break;

    switch (c) {
      case OPT_BROKER:
        opts.broker = optarg;
        break;
      case OPT_PORT:
        if (!parse_uint(optarg, 1, 65535, &v)) { *err = "--port"; return ParseResult::USAGE_ERROR; }
        opts.port = static_cast<uint16_t>(v);
        break;
      case OPT_NAME:
        opts.name = optarg;
        break;
      case OPT_DOMAIN:
        opts.domain = optarg;
        break;
      case OPT_PORT_PATH:
        opts.port_path = optarg;
        break;
      case OPT_BAUD:
        if (!parse_uint(optarg, 1200, 115200, &v)) { *err = "--baud"; return ParseResult::USAGE_ERROR; }
        opts.baud = static_cast<uint32_t>(v);
        break;
      case OPT_SLAVE_ADDRESS:
        if (!parse_uint(optarg, SERIAL_DEFAULTS.unit_id_min, SERIAL_DEFAULTS.unit_id_max, &v)) {
          *err = "--slave-address";
          return ParseResult::USAGE_ERROR;
        }
        opts.slave_address = static_cast<int>(v);
        break;
      case OPT_PUBLISH_FREQUENCY:
        if (!parse_uint(optarg, 1, 86400, &v)) { *err = "--publish-frequency"; return ParseResult::USAGE_ERROR; }
        opts.publish_interval_s = static_cast<uint32_t>(v);
        break;
      case OPT_QOS:
        if (!parse_uint(optarg, 0, 2, &v)) { *err = "--qos"; return ParseResult::USAGE_ERROR; }
        opts.qos = static_cast<uint8_t>(v);
        break;
      case OPT_KEEPALIVE:
        if (!parse_uint(optarg, 5, 65535, &v)) { *err = "--keepalive"; return ParseResult::USAGE_ERROR; }
        opts.keepalive_s = static_cast<uint16_t>(v);
        break;
      case OPT_TIMEOUT_MS:
        if (!parse_uint(optarg, 10, 60000, &v)) { *err = "--timeout-ms"; return ParseResult::USAGE_ERROR; }
        opts.timeout_ms = static_cast<uint32_t>(v);
        break;
      case OPT_CONNECT_TIMEOUT:
        if (!parse_uint(optarg, 1, 3600, &v)) { *err = "--connect-timeout"; return ParseResult::USAGE_ERROR; }
        opts.connect_timeout_s = static_cast<uint32_t>(v);
        break;
      case 'v':
        opts.verbose = true;
        break;
      case 'h':
        return ParseResult::HELP;
      default:
        *err = "unknown option";
        return ParseResult::USAGE_ERROR;
    }
  }

  if (optind < argc) { *err = "unexpected argument"; return ParseResult::USAGE_ERROR; }
  if (opts.broker.empty()) { *err = "--broker is required"; return ParseResult::USAGE_ERROR; }
  if (opts.name.empty()) { *err = "--name is required"; return ParseResult::USAGE_ERROR; }
  if (!valid_topic_segment(opts.name)) { *err = "--name"; return ParseResult::USAGE_ERROR; }
  if (!valid_topic_segment(opts.domain)) { *err = "--domain"; return ParseResult::USAGE_ERROR; }

  *out = std::move(opts);
  return ParseResult::OK;
}

void print_usage(FILE* f, const char* prog) {
  fprintf(f,
          "usage: %s --broker HOST --name NAME [options]\n"
          "\n"
          "  --broker HOST            MQTT broker host\n"
          "  --port N                 MQTT broker port (default %u)\n"
          "  --name NAME              client name, used as <domain>/<name>/...\n"
          "  --domain D               topic root (default %s)\n"
          "  --port-path DEVICE       serial device (default: find the %s adapter)\n"
          "  --baud N                 serial speed (default %u)\n"
          "  --slave-address N        Modbus unit id 1-247 (default: scan the bus)\n"
          "  --publish-frequency S    seconds between samples (default %u)\n"
          "  --qos N                  data QoS 0, 1 or 2 (default %u)\n"
          "  --keepalive S            MQTT keepalive seconds (default %u)\n"
          "  --timeout-ms N           Modbus response timeout (default %u)\n"
          "  --connect-timeout S      wait for the broker at startup (default %u)\n"
          "  -v, --verbose            debug logging\n"
          "  -h, --help               this text\n",
          prog, static_cast<unsigned>(MQTT_DEFAULTS.broker_port), MQTT_DEFAULTS.domain, USB_SERIAL_DEFAULTS.product,
          static_cast<unsigned>(SERIAL_DEFAULTS.baud), static_cast<unsigned>(SCHEDULE_DEFAULTS.publish_interval_s),
          static_cast<unsigned>(MQTT_DEFAULTS.data_qos), static_cast<unsigned>(MQTT_DEFAULTS.keepalive_s),
          static_cast<unsigned>(SERIAL_DEFAULTS.response_timeout_ms),
          static_cast<unsigned>(MQTT_DEFAULTS.connect_timeout_s));
}
