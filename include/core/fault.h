#pragma once
#include <stdint.h>

enum class FaultKind : uint8_t {
  NONE          = 0,
  TRANSPORT     = 1, // bus or broker I/O: timeout, CRC, framing, refused
  DECODE        = 2, // register payload does not fit the field
  CONFIGURATION = 3  // missing or ambiguous device at startup
};

struct Fault {
  FaultKind kind {FaultKind::NONE};
  const char* reason {""}; // short machine-readable string, static storage

  bool ok() const { return kind == FaultKind::NONE; }
};

inline Fault make_fault(FaultKind kind, const char* reason) {
  Fault f;
  f.kind = kind;
  f.reason = reason;
  return f;
}

inline const char* to_str(FaultKind kind) {
  switch (kind) {
    case FaultKind::NONE:          return "NONE";
    case FaultKind::TRANSPORT:     return "TRANSPORT";
    case FaultKind::DECODE:        return "DECODE";
    case FaultKind::CONFIGURATION: return "CONFIGURATION";
    default: return "UNKNOWN";
  }
}
