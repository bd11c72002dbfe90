#pragma once
#include <stdint.h>

#include <string>

#include <modbus/modbus.h>

#include "core/register_transport.h"

struct SerialLinkConfig {
  std::string device;          // e.g. /dev/ttyUSB0
  uint32_t baud {9600};
  char parity {'N'};
  uint8_t data_bits {8};
  uint8_t stop_bits {1};
  uint32_t response_timeout_ms {1000};
};

// Modbus RTU master on a serial line, reading holding registers of one unit.
class ModbusRtuLink : public IAddressableTransport {
public:
  explicit ModbusRtuLink(SerialLinkConfig cfg);
  ~ModbusRtuLink() override;

  ModbusRtuLink(const ModbusRtuLink&) = delete;
  ModbusRtuLink& operator=(const ModbusRtuLink&) = delete;

  // Opens the serial device. On failure *err names the cause.
  bool open(const char** err);
  void close();
  bool is_open() const { return ctx_ != nullptr; }

  bool read_registers(uint16_t address, uint16_t count, uint16_t* out, const char** err) override;
  bool select_unit(uint8_t unit_id) override;
  uint8_t unit() const override { return unit_id_; }
  void set_probe_timeout_ms(uint32_t timeout_ms) override;

  const SerialLinkConfig& config() const { return cfg_; }

private:
  void apply_timeout(uint32_t timeout_ms);

  SerialLinkConfig cfg_;
  modbus_t* ctx_ {nullptr};
  uint8_t unit_id_ {0};
};
