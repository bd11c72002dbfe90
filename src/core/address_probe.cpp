#define LOG_TAG "probe"
#include "core/address_probe.h"

#include "app/app_config.h"
#include "core/log.h"

namespace {
struct ProbeRead {
  uint16_t address;
  uint16_t count;
};

constexpr ProbeRead kProbeReads[] = {
  {Renogy::MODEL, Renogy::MODEL_WORDS},
  {Renogy::PROBE_ALT, 8},
};

bool unit_answers(IAddressableTransport& link) {
  uint16_t regs[8] {};
  for (const ProbeRead& p : kProbeReads) {
    const char* err = nullptr;
    if (link.read_registers(p.address, p.count, regs, &err)) return true;
  }
  return false;
}
} // namespace

bool probe_unit_address(IAddressableTransport& link, const ProbeRange& range, uint8_t* found,
                        Fault* fault) {
  if (range.first == 0 || range.first > range.last) {
    if (fault) *fault = make_fault(FaultKind::CONFIGURATION, "invalid_probe_range");
    return false;
  }

  LOGI("scanning unit ids %u..%u", static_cast<unsigned>(range.first), static_cast<unsigned>(range.last));
  link.set_probe_timeout_ms(range.timeout_ms);

  uint8_t first_hit = 0;
  unsigned hits = 0;
  for (unsigned id = range.first; id <= range.last; ++id) {
    if (!link.select_unit(static_cast<uint8_t>(id))) continue;
    if (!unit_answers(link)) continue;

    LOGI("unit %u responded", id);
    if (hits == 0) first_hit = static_cast<uint8_t>(id);
    hits++;
  }

  link.set_probe_timeout_ms(0);

  if (hits == 0) {
    if (fault) *fault = make_fault(FaultKind::CONFIGURATION, "no_device_found");
    return false;
  }
  if (hits > 1) {
    LOGE("%u units answered; pass --slave-address to pick one", hits);
    if (fault) *fault = make_fault(FaultKind::CONFIGURATION, "multiple_devices_found");
    return false;
  }

  if (!link.select_unit(first_hit)) {
    if (fault) *fault = make_fault(FaultKind::CONFIGURATION, "select_unit_failed");
    return false;
  }
  if (found) *found = first_hit;
  return true;
}
