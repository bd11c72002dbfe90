#pragma once
#include <stdint.h>

#include "core/fault.h"
#include "core/register_transport.h"

struct ProbeRange {
  uint8_t first {1};
  uint8_t last {247};
  uint32_t timeout_ms {100};
};

// Scans the bus for the one unit that answers the controller's model
// registers. Leaves the transport pointed at the found unit and restores the
// normal response timeout. Zero or several responders are CONFIGURATION faults.
bool probe_unit_address(IAddressableTransport& link, const ProbeRange& range, uint8_t* found,
                        Fault* fault);
