#pragma once
#include <stddef.h>
#include <stdint.h>

#include "config/bridge_defaults.h"
#include "core/register_decoder.h"

// Bumped whenever the JSON layout on <base>/status or <base>/data changes.
#define RENOGY_BRIDGE_SCHEMA_V 1

static constexpr const char* BRIDGE_FW_NAME = "renogy_bridge";

// -------- Defaults --------
static constexpr MqttDefaults MQTT_DEFAULTS         = BRIDGE_MQTT_DEFAULTS;
static constexpr SerialDefaults SERIAL_DEFAULTS     = BRIDGE_SERIAL_DEFAULTS;
static constexpr ScheduleDefaults SCHEDULE_DEFAULTS = BRIDGE_SCHEDULE_DEFAULTS;
static constexpr UsbSerialDefaults USB_SERIAL_DEFAULTS = BRIDGE_USB_SERIAL_DEFAULTS;

static constexpr const char* STATUS_SUBTOPIC = "status";
static constexpr const char* DATA_SUBTOPIC   = "data";

// Register map for Renogy Rover / Wanderer / Adventurer charge controllers.
// Addresses are 0-based PDU addresses (holding registers, function 0x03).
namespace Renogy {
enum Reg : uint16_t {
  RATING_VOLT_CURR  = 0x000A, // hi: max system voltage V, lo: rated charge current A
  RATING_DISCH_TYPE = 0x000B, // hi: rated discharge current A, lo: 0 controller / 1 inverter
  MODEL             = 0x000C, // 8 words, ASCII
  SOFTWARE_VERSION  = 0x0014, // 2 words
  HARDWARE_VERSION  = 0x0016, // 2 words
  SERIAL_NUMBER     = 0x0018, // 2 words
  BATTERY_SOC       = 0x0100, // %
  BATTERY_VOLTAGE   = 0x0101, // x0.1 V
  TEMPERATURES      = 0x0103, // hi: controller, lo: battery; sign-magnitude C
  LOAD_VOLTAGE      = 0x0104, // x0.1 V
  LOAD_CURRENT      = 0x0105, // x0.01 A
  LOAD_POWER        = 0x0106, // W
  SOLAR_VOLTAGE     = 0x0107, // x0.1 V
  SOLAR_CURRENT     = 0x0108, // x0.01 A
  SOLAR_POWER       = 0x0109, // W
  BATTERY_MIN_TODAY = 0x010B, // x0.1 V
  BATTERY_MAX_TODAY = 0x010C, // x0.1 V
  SOLAR_MAX_TODAY   = 0x010F, // W
  SOLAR_MIN_TODAY   = 0x0110, // W
  PROBE_ALT         = 0x1402  // 8 words, answered by newer firmware only
};

static constexpr uint16_t MODEL_WORDS = 8;

inline const char* controller_type_name(uint8_t raw) {
  switch (raw) {
    case 0: return "controller";
    case 1: return "inverter";
    default: return "unknown";
  }
}
} // namespace Renogy

// Telemetry fields in publish order. DeviceSession::get_data() walks this table.
inline constexpr RegisterSpec TELEMETRY_FIELDS[] = {
  {"solar_voltage", Renogy::SOLAR_VOLTAGE, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 10}, "V"},
  {"solar_current", Renogy::SOLAR_CURRENT, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 100}, "A"},
  {"solar_power", Renogy::SOLAR_POWER, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 1}, "W"},
  {"load_voltage", Renogy::LOAD_VOLTAGE, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 10}, "V"},
  {"load_current", Renogy::LOAD_CURRENT, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 100}, "A"},
  {"load_power", Renogy::LOAD_POWER, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 1}, "W"},
  {"battery_voltage", Renogy::BATTERY_VOLTAGE, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 10}, "V"},
  {"battery_state_of_charge", Renogy::BATTERY_SOC, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 1}, "%"},
  {"battery_temperature", Renogy::TEMPERATURES, 1, DecodeMethod::SCALED_SIGNED, ByteLane::LOW_BYTE, {1, 1}, "C"},
  {"controller_temperature", Renogy::TEMPERATURES, 1, DecodeMethod::SCALED_SIGNED, ByteLane::HIGH_BYTE, {1, 1}, "C"},
  {"maximum_solar_power_today", Renogy::SOLAR_MAX_TODAY, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 1}, "W"},
  {"minimum_solar_power_today", Renogy::SOLAR_MIN_TODAY, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 1}, "W"},
  {"maximum_battery_voltage_today", Renogy::BATTERY_MAX_TODAY, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 10}, "V"},
  {"minimum_battery_voltage_today", Renogy::BATTERY_MIN_TODAY, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::WORD, {1, 10}, "V"},
};

// Identity fields carried by the status message.
inline constexpr RegisterSpec IDENTITY_FIELDS[] = {
  {"model", Renogy::MODEL, Renogy::MODEL_WORDS, DecodeMethod::BIG_ENDIAN_ASCII, ByteLane::WORD, {1, 1}, ""},
  {"serial_number", Renogy::SERIAL_NUMBER, 2, DecodeMethod::HEX_WORDS, ByteLane::WORD, {1, 1}, ""},
  {"software_version", Renogy::SOFTWARE_VERSION, 2, DecodeMethod::VERSION_TRIPLET, ByteLane::WORD, {1, 1}, ""},
  {"hardware_version", Renogy::HARDWARE_VERSION, 2, DecodeMethod::VERSION_TRIPLET, ByteLane::WORD, {1, 1}, ""},
  {"voltage_rating", Renogy::RATING_VOLT_CURR, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::HIGH_BYTE, {1, 1}, "V"},
  {"current_rating", Renogy::RATING_VOLT_CURR, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::LOW_BYTE, {1, 1}, "A"},
  {"discharge_rating", Renogy::RATING_DISCH_TYPE, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::HIGH_BYTE, {1, 1}, "A"},
  {"controller_type", Renogy::RATING_DISCH_TYPE, 1, DecodeMethod::SCALED_UNSIGNED, ByteLane::LOW_BYTE, {1, 1}, ""},
};

static constexpr size_t TELEMETRY_FIELD_COUNT = sizeof(TELEMETRY_FIELDS) / sizeof(TELEMETRY_FIELDS[0]);
static constexpr size_t IDENTITY_FIELD_COUNT  = sizeof(IDENTITY_FIELDS) / sizeof(IDENTITY_FIELDS[0]);
