#define LOG_TAG "device"
#include "core/device_session.h"

#include <string.h>

#include <utility>

#include "app/app_config.h"
#include "core/log.h"

namespace {
constexpr uint16_t kMaxWords = 16;

const RegisterSpec* find_spec(const char* name) {
  if (!name) return nullptr;
  for (const RegisterSpec& s : TELEMETRY_FIELDS) {
    if (strcmp(s.name, name) == 0) return &s;
  }
  for (const RegisterSpec& s : IDENTITY_FIELDS) {
    if (strcmp(s.name, name) == 0) return &s;
  }
  return nullptr;
}
} // namespace

DeviceSession::DeviceSession(IRegisterTransport& link) : link_(link) {}

bool DeviceSession::read(const char* field_name, RegisterValue* out, Fault* fault) {
  const RegisterSpec* spec = find_spec(field_name);
  if (!spec) {
    if (fault) *fault = make_fault(FaultKind::DECODE, "unknown_field");
    return false;
  }
  return read_spec(*spec, out, fault);
}

bool DeviceSession::read_spec(const RegisterSpec& spec, RegisterValue* out, Fault* fault) {
  if (spec.word_count == 0 || spec.word_count > kMaxWords) {
    if (fault) *fault = make_fault(FaultKind::DECODE, "invalid_register_spec");
    return false;
  }

  uint16_t regs[kMaxWords] {};
  const char* err = nullptr;
  if (!link_.read_registers(spec.address, spec.word_count, regs, &err)) {
    if (fault) *fault = make_fault(FaultKind::TRANSPORT, err ? err : "read_failed");
    return false;
  }
  return decoder::decode(spec, regs, spec.word_count, out, fault);
}

bool DeviceSession::read_number(const char* name, double* out, Fault* fault) {
  RegisterValue v;
  if (!read(name, &v, fault)) return false;
  if (!v.is_number()) {
    if (fault) *fault = make_fault(FaultKind::DECODE, "not_numeric");
    return false;
  }
  if (out) *out = v.number;
  return true;
}

bool DeviceSession::read_text(const char* name, std::string* out, Fault* fault) {
  RegisterValue v;
  if (!read(name, &v, fault)) return false;
  if (v.is_number()) {
    if (fault) *fault = make_fault(FaultKind::DECODE, "not_text");
    return false;
  }
  if (out) *out = std::move(v.text);
  return true;
}

bool DeviceSession::controller_type(std::string* s, Fault* f) {
  double raw = 0;
  if (!read_number("controller_type", &raw, f)) return false;
  if (s) *s = Renogy::controller_type_name(static_cast<uint8_t>(raw));
  return true;
}

TelemetryRecord DeviceSession::get_data() {
  std::vector<TelemetryField> fields;
  fields.reserve(TELEMETRY_FIELD_COUNT);

  for (const RegisterSpec& spec : TELEMETRY_FIELDS) {
    RegisterValue v;
    Fault fault;
    if (!read_spec(spec, &v, &fault)) {
      failed_reads_++;
      LOGW("%s (reg 0x%04X) omitted: %s %s", spec.name, spec.address, to_str(fault.kind), fault.reason);
      continue;
    }
    fields.push_back(TelemetryField{spec.name, v.number, spec.unit});
  }

  LOGD("sample: %zu/%zu fields", fields.size(), TELEMETRY_FIELD_COUNT);
  return TelemetryRecord(std::move(fields), format_local_timestamp());
}

DeviceIdentity DeviceSession::get_identity() {
  DeviceIdentity id;
  id.entries.reserve(IDENTITY_FIELD_COUNT);

  for (const RegisterSpec& spec : IDENTITY_FIELDS) {
    RegisterValue v;
    Fault fault;
    if (!read_spec(spec, &v, &fault)) {
      failed_reads_++;
      LOGW("%s (reg 0x%04X) unavailable: %s %s", spec.name, spec.address, to_str(fault.kind), fault.reason);
      continue;
    }

    IdentityEntry e {spec.name, !v.is_number(), std::move(v.text), v.number};
    if (strcmp(spec.name, "controller_type") == 0) {
      e.is_text = true;
      e.text = Renogy::controller_type_name(static_cast<uint8_t>(v.number));
    }
    id.entries.push_back(std::move(e));
  }
  return id;
}
