#pragma once
#include <stdint.h>

#include <string>

#include "core/fault.h"
#include "core/register_decoder.h"
#include "core/register_transport.h"
#include "core/telemetry.h"

// Named access to one charge controller. Each read is one register request
// followed by one decode; nothing is retried here.
class DeviceSession {
public:
  explicit DeviceSession(IRegisterTransport& link);

  // Looks the field up in the telemetry and identity tables.
  bool read(const char* field_name, RegisterValue* out, Fault* fault);
  bool read_spec(const RegisterSpec& spec, RegisterValue* out, Fault* fault);

  bool solar_voltage(double* v, Fault* f = nullptr) { return read_number("solar_voltage", v, f); }
  bool solar_current(double* v, Fault* f = nullptr) { return read_number("solar_current", v, f); }
  bool solar_power(double* v, Fault* f = nullptr) { return read_number("solar_power", v, f); }
  bool load_voltage(double* v, Fault* f = nullptr) { return read_number("load_voltage", v, f); }
  bool load_current(double* v, Fault* f = nullptr) { return read_number("load_current", v, f); }
  bool load_power(double* v, Fault* f = nullptr) { return read_number("load_power", v, f); }
  bool battery_voltage(double* v, Fault* f = nullptr) { return read_number("battery_voltage", v, f); }
  bool battery_state_of_charge(double* v, Fault* f = nullptr) {
    return read_number("battery_state_of_charge", v, f);
  }
  bool battery_temperature(double* v, Fault* f = nullptr) { return read_number("battery_temperature", v, f); }
  bool controller_temperature(double* v, Fault* f = nullptr) {
    return read_number("controller_temperature", v, f);
  }
  bool maximum_solar_power_today(double* v, Fault* f = nullptr) {
    return read_number("maximum_solar_power_today", v, f);
  }
  bool minimum_solar_power_today(double* v, Fault* f = nullptr) {
    return read_number("minimum_solar_power_today", v, f);
  }
  bool maximum_battery_voltage_today(double* v, Fault* f = nullptr) {
    return read_number("maximum_battery_voltage_today", v, f);
  }
  bool minimum_battery_voltage_today(double* v, Fault* f = nullptr) {
    return read_number("minimum_battery_voltage_today", v, f);
  }

  bool model(std::string* s, Fault* f = nullptr) { return read_text("model", s, f); }
  bool serial_number(std::string* s, Fault* f = nullptr) { return read_text("serial_number", s, f); }
  bool software_version(std::string* s, Fault* f = nullptr) { return read_text("software_version", s, f); }
  bool hardware_version(std::string* s, Fault* f = nullptr) { return read_text("hardware_version", s, f); }
  bool voltage_rating(double* v, Fault* f = nullptr) { return read_number("voltage_rating", v, f); }
  bool current_rating(double* v, Fault* f = nullptr) { return read_number("current_rating", v, f); }
  bool discharge_rating(double* v, Fault* f = nullptr) { return read_number("discharge_rating", v, f); }
  bool controller_type(std::string* s, Fault* f = nullptr);

  // All telemetry fields in table order. A field that fails is logged and left out.
  TelemetryRecord get_data();

  // Same omission policy as get_data().
  DeviceIdentity get_identity();

  uint32_t failed_reads() const { return failed_reads_; }

private:
  bool read_number(const char* name, double* out, Fault* fault);
  bool read_text(const char* name, std::string* out, Fault* fault);

  IRegisterTransport& link_;
  uint32_t failed_reads_ {0};
};
