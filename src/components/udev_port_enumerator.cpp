#define LOG_TAG "udev"
#include "components/udev_port_enumerator.h"

#include <libudev.h>

#include <utility>

#include "core/log.h"

namespace {
const char* attr_or_empty(struct udev_device* dev, const char* name) {
  const char* v = udev_device_get_sysattr_value(dev, name);
  return v ? v : "";
}
} // namespace

UdevPortEnumerator::UdevPortEnumerator() : udev_(udev_new()) {
  if (!udev_) LOGE("udev_new failed");
}

UdevPortEnumerator::~UdevPortEnumerator() {
  if (udev_) udev_unref(udev_);
}

bool UdevPortEnumerator::list_ports(std::vector<SerialPortInfo>* out, const char** err) {
  if (!udev_) {
    if (err) *err = "udev unavailable";
    return false;
  }

  struct udev_enumerate* e = udev_enumerate_new(udev_);
  if (!e) {
    if (err) *err = "udev_enumerate_new failed";
    return false;
  }
  if (udev_enumerate_add_match_subsystem(e, "tty") < 0 || udev_enumerate_scan_devices(e) < 0) {
    udev_enumerate_unref(e);
    if (err) *err = "tty scan failed";
    return false;
  }

  out->clear();
  struct udev_list_entry* entry = nullptr;
  udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(e)) {
    struct udev_device* dev = udev_device_new_from_syspath(udev_, udev_list_entry_get_name(entry));
    if (!dev) continue;

    const char* node = udev_device_get_devnode(dev);
    // The parent is owned by dev and released with it.
    struct udev_device* usb = udev_device_get_parent_with_subsystem_devtype(dev, "usb", "usb_device");
    if (node && usb) {
      SerialPortInfo info;
      info.devnode = node;
      info.vendor_id = attr_or_empty(usb, "idVendor");
      info.product_id = attr_or_empty(usb, "idProduct");
      info.product = attr_or_empty(usb, "product");
      out->push_back(std::move(info));
    }
    udev_device_unref(dev);
  }
  udev_enumerate_unref(e);

  LOGD("%zu USB serial ports", out->size());
  return true;
}
