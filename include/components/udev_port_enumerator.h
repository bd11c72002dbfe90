#pragma once
#include <vector>

#include "core/serial_port_finder.h"

struct udev;

// Lists tty devices through libudev, filling the USB attributes from the
// parent usb_device when there is one.
class UdevPortEnumerator : public ISerialPortEnumerator {
public:
  UdevPortEnumerator();
  ~UdevPortEnumerator() override;

  UdevPortEnumerator(const UdevPortEnumerator&) = delete;
  UdevPortEnumerator& operator=(const UdevPortEnumerator&) = delete;

  bool list_ports(std::vector<SerialPortInfo>* out, const char** err) override;

private:
  struct udev* udev_ {nullptr};
};
