#pragma once
#include <string>
#include <vector>

#include "config/bridge_defaults.h"
#include "core/fault.h"

// One tty device as seen by the host, with the USB attributes of the device
// that carries it. Non-USB ports leave the USB strings empty.
struct SerialPortInfo {
  std::string devnode;    // /dev/ttyUSB0
  std::string vendor_id;  // "0403"
  std::string product_id; // "6015"
  std::string product;    // "FT231X USB UART"
};

class ISerialPortEnumerator {
public:
  virtual ~ISerialPortEnumerator() = default;

  // Lists every serial port currently present. On failure *err names the cause.
  virtual bool list_ports(std::vector<SerialPortInfo>* out, const char** err) = 0;
};

bool matches_usb_serial(const SerialPortInfo& port, const UsbSerialDefaults& match);

// Picks the single port whose USB ids and product string match. Zero or
// several matches are CONFIGURATION faults; an enumeration error is TRANSPORT.
bool find_usb_serial_port(ISerialPortEnumerator& ports, const UsbSerialDefaults& match, std::string* devnode,
                          Fault* fault);
