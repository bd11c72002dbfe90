#pragma once
#include <stddef.h>
#include <stdint.h>

#include <string>

#include "core/fault.h"

enum class DecodeMethod : uint8_t {
  BIG_ENDIAN_ASCII = 0, // 2 chars per word, high byte first
  SCALED_UNSIGNED  = 1,
  SCALED_SIGNED    = 2,
  VERSION_TRIPLET  = 3, // 2 words -> "V{b1}.{b2}.{b3}"
  HEX_WORDS        = 4  // 4 hex digits per word
};

// Which part of a single-word register carries the value.
enum class ByteLane : uint8_t { WORD = 0, HIGH_BYTE = 1, LOW_BYTE = 2 };

struct Scale {
  int32_t num {1};
  int32_t den {1};
};

struct RegisterSpec {
  const char* name;
  uint16_t address;    // 0-based PDU address
  uint16_t word_count;
  DecodeMethod decode;
  ByteLane lane;
  Scale scale;
  const char* unit;
};

struct RegisterValue {
  enum class Type : uint8_t { NUMBER, TEXT };

  Type type {Type::NUMBER};
  double number {0.0};
  std::string text {};

  bool is_number() const { return type == Type::NUMBER; }
};

namespace decoder {

// Words required by a decode method; 0 means "one or more".
uint16_t required_words(DecodeMethod method);

// True when word_count and lane are consistent with the decode method.
bool spec_valid(const RegisterSpec& spec);

bool decode_ascii(const uint16_t* words, size_t count, size_t expected, std::string* out, Fault* fault);
bool decode_scaled(const uint16_t* words, size_t count, bool is_signed, ByteLane lane, Scale scale,
                   double* out, Fault* fault);
bool decode_version(const uint16_t* words, size_t count, std::string* out, Fault* fault);
bool decode_hex(const uint16_t* words, size_t count, size_t expected, std::string* out, Fault* fault);

// Dispatches on spec.decode. On failure *fault carries kind DECODE and *out is untouched.
bool decode(const RegisterSpec& spec, const uint16_t* words, size_t count, RegisterValue* out,
            Fault* fault);

} // namespace decoder
