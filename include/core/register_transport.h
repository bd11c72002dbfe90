#pragma once
#include <stdint.h>

// Request/response access to one device's holding registers. Framing, CRC and
// wire-level retries belong to the implementation.
class IRegisterTransport {
public:
  virtual ~IRegisterTransport() = default;

  // Reads count consecutive registers starting at address into out[0..count).
  // On failure returns false and sets *err to a short static reason.
  virtual bool read_registers(uint16_t address, uint16_t count, uint16_t* out, const char** err) = 0;
};

// A transport on a shared bus where the target unit id can be switched.
class IAddressableTransport : public IRegisterTransport {
public:
  virtual bool select_unit(uint8_t unit_id) = 0;
  virtual uint8_t unit() const = 0;

  // Shortens the response timeout while scanning; 0 restores the configured value.
  virtual void set_probe_timeout_ms(uint32_t timeout_ms) = 0;
};
