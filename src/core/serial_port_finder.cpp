#define LOG_TAG "usb"
#include "core/serial_port_finder.h"

#include <strings.h>

#include "core/log.h"

namespace {
bool same_id(const std::string& have, const char* want) {
  return want == nullptr || *want == '\0' || strcasecmp(have.c_str(), want) == 0;
}
} // namespace

bool matches_usb_serial(const SerialPortInfo& port, const UsbSerialDefaults& match) {
  if (!same_id(port.vendor_id, match.vendor_id)) return false;
  if (!same_id(port.product_id, match.product_id)) return false;
  if (match.product && *match.product && port.product.find(match.product) == std::string::npos) return false;
  return !port.devnode.empty();
}

bool find_usb_serial_port(ISerialPortEnumerator& ports, const UsbSerialDefaults& match, std::string* devnode,
                          Fault* fault) {
  std::vector<SerialPortInfo> all;
  const char* err = "";
  if (!ports.list_ports(&all, &err)) {
    LOGE("cannot list serial ports: %s", err);
    if (fault) *fault = make_fault(FaultKind::TRANSPORT, "port_enumeration_failed");
    return false;
  }

  const SerialPortInfo* hit = nullptr;
  unsigned hits = 0;
  for (const SerialPortInfo& port : all) {
    if (!matches_usb_serial(port, match)) continue;
    LOGD("candidate %s (%s:%s %s)", port.devnode.c_str(), port.vendor_id.c_str(), port.product_id.c_str(),
         port.product.c_str());
    if (!hit) hit = &port;
    hits++;
  }

  if (hits == 0) {
    LOGE("no %s adapter among %zu serial ports", match.product, all.size());
    if (fault) *fault = make_fault(FaultKind::CONFIGURATION, "no_usb_serial_found");
    return false;
  }
  if (hits > 1) {
    LOGE("%u %s adapters attached, pass --port-path", hits, match.product);
    if (fault) *fault = make_fault(FaultKind::CONFIGURATION, "multiple_usb_serial_found");
    return false;
  }

  LOGI("using %s", hit->devnode.c_str());
  *devnode = hit->devnode;
  if (fault) *fault = Fault {};
  return true;
}
