#define LOG_TAG "modbus"
#include "components/modbus_rtu_link.h"

#include <errno.h>

#include <utility>

#include "core/log.h"

ModbusRtuLink::ModbusRtuLink(SerialLinkConfig cfg) : cfg_(std::move(cfg)) {}

ModbusRtuLink::~ModbusRtuLink() {
  close();
}

bool ModbusRtuLink::open(const char** err) {
  if (ctx_) return true;

  ctx_ = modbus_new_rtu(cfg_.device.c_str(), static_cast<int>(cfg_.baud), cfg_.parity, cfg_.data_bits,
                        cfg_.stop_bits);
  if (!ctx_) {
    if (err) *err = modbus_strerror(errno);
    LOGE("modbus_new_rtu(%s) failed: %s", cfg_.device.c_str(), modbus_strerror(errno));
    return false;
  }

  apply_timeout(cfg_.response_timeout_ms);

  if (modbus_connect(ctx_) == -1) {
    const int e = errno;
    if (err) *err = modbus_strerror(e);
    LOGE("open %s failed: %s", cfg_.device.c_str(), modbus_strerror(e));
    modbus_free(ctx_);
    ctx_ = nullptr;
    return false;
  }

  LOGI("opened %s @ %u %u%c%u", cfg_.device.c_str(), static_cast<unsigned>(cfg_.baud),
       static_cast<unsigned>(cfg_.data_bits), cfg_.parity, static_cast<unsigned>(cfg_.stop_bits));
  return true;
}

void ModbusRtuLink::close() {
  if (!ctx_) return;
  modbus_close(ctx_);
  modbus_free(ctx_);
  ctx_ = nullptr;
}

bool ModbusRtuLink::select_unit(uint8_t unit_id) {
  if (!ctx_) return false;
  if (modbus_set_slave(ctx_, unit_id) == -1) {
    LOGE("invalid unit id %u: %s", static_cast<unsigned>(unit_id), modbus_strerror(errno));
    return false;
  }
  unit_id_ = unit_id;
  return true;
}

void ModbusRtuLink::set_probe_timeout_ms(uint32_t timeout_ms) {
  if (!ctx_) return;
  apply_timeout(timeout_ms == 0 ? cfg_.response_timeout_ms : timeout_ms);
}

void ModbusRtuLink::apply_timeout(uint32_t timeout_ms) {
  modbus_set_response_timeout(ctx_, timeout_ms / 1000, (timeout_ms % 1000) * 1000);
}

bool ModbusRtuLink::read_registers(uint16_t address, uint16_t count, uint16_t* out, const char** err) {
  if (!ctx_) {
    if (err) *err = "link_closed";
    return false;
  }

  const int got = modbus_read_registers(ctx_, address, count, out);
  if (got == -1) {
    const int e = errno;
    if (err) *err = modbus_strerror(e);
    LOGD("unit %u read 0x%04X x%u failed: %s", static_cast<unsigned>(unit_id_), address,
         static_cast<unsigned>(count), modbus_strerror(e));
    // Drop any partial frame so the next request starts clean.
    modbus_flush(ctx_);
    return false;
  }
  if (got != count) {
    if (err) *err = "short_read";
    return false;
  }
  return true;
}
