#pragma once
#include <stdint.h>

struct MqttDefaults {
  const char* domain;
  uint16_t broker_port;
  uint16_t keepalive_s;
  uint8_t data_qos;
  uint8_t status_qos;
  uint32_t connect_timeout_s;
};

struct SerialDefaults {
  uint32_t baud;
  char parity;
  uint8_t data_bits;
  uint8_t stop_bits;
  uint32_t response_timeout_ms;
  uint32_t probe_timeout_ms;
  uint8_t unit_id_min;
  uint8_t unit_id_max;
};

struct UsbSerialDefaults {
  const char* vendor_id;  // idVendor, lowercase hex as sysfs reports it
  const char* product_id; // idProduct
  const char* product;    // substring of the USB product string
};

struct ScheduleDefaults {
  uint32_t publish_interval_s;
};

inline constexpr MqttDefaults BRIDGE_MQTT_DEFAULTS{
  .domain = "solar",
  .broker_port = 1883,
  .keepalive_s = 60,
  .data_qos = 1,     // command-line default; PublishSession itself defaults to 0
  .status_qos = 1,
  .connect_timeout_s = 10,
};

// Renogy controllers ship at 9600 8N1.
inline constexpr SerialDefaults BRIDGE_SERIAL_DEFAULTS{
  .baud = 9600,
  .parity = 'N',
  .data_bits = 8,
  .stop_bits = 1,
  .response_timeout_ms = 1000,
  .probe_timeout_ms = 100,
  .unit_id_min = 1,
  .unit_id_max = 247,
};

// Renogy's RS485 cable is an FTDI FT231X bridge.
inline constexpr UsbSerialDefaults BRIDGE_USB_SERIAL_DEFAULTS{
  .vendor_id = "0403",
  .product_id = "6015",
  .product = "FT231X USB UART",
};

inline constexpr ScheduleDefaults BRIDGE_SCHEDULE_DEFAULTS{
  .publish_interval_s = 60,
};
