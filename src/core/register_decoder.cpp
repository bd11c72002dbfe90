#include "core/register_decoder.h"

#include <stdio.h>

#include <utility>

namespace {

bool length_fault(Fault* fault, const char* reason) {
  if (fault) *fault = make_fault(FaultKind::DECODE, reason);
  return false;
}

char printable(uint8_t b) {
  return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '?';
}

int32_t lane_value(uint16_t word, bool is_signed, ByteLane lane) {
  if (lane == ByteLane::WORD) {
    return is_signed ? static_cast<int32_t>(static_cast<int16_t>(word)) : static_cast<int32_t>(word);
  }

  const uint8_t b = (lane == ByteLane::HIGH_BYTE) ? static_cast<uint8_t>(word >> 8)
                                                  : static_cast<uint8_t>(word & 0xFF);
  if (!is_signed) return b;

  // Controller encodes signed bytes as sign-magnitude: bit 7 set means negative.
  const int32_t magnitude = b & 0x7F;
  return (b & 0x80) ? -magnitude : magnitude;
}

} // namespace

uint16_t decoder::required_words(DecodeMethod method) {
  switch (method) {
    case DecodeMethod::SCALED_UNSIGNED:
    case DecodeMethod::SCALED_SIGNED:   return 1;
    case DecodeMethod::VERSION_TRIPLET: return 2;
    case DecodeMethod::BIG_ENDIAN_ASCII:
    case DecodeMethod::HEX_WORDS:
    default: return 0;
  }
}

bool decoder::spec_valid(const RegisterSpec& spec) {
  if (spec.word_count == 0) return false;
  const uint16_t required = required_words(spec.decode);
  if (required != 0 && spec.word_count != required) return false;

  const bool scaled =
    spec.decode == DecodeMethod::SCALED_UNSIGNED || spec.decode == DecodeMethod::SCALED_SIGNED;
  if (!scaled && spec.lane != ByteLane::WORD) return false;
  if (scaled && spec.scale.den == 0) return false;
  return true;
}

bool decoder::decode_ascii(const uint16_t* words, size_t count, size_t expected, std::string* out,
                           Fault* fault) {
  if (!words || count == 0 || count != expected) return length_fault(fault, "ascii_length_mismatch");

  std::string s;
  s.reserve(count * 2);
  for (size_t i = 0; i < count; ++i) {
    s.push_back(static_cast<char>(words[i] >> 8));
    s.push_back(static_cast<char>(words[i] & 0xFF));
  }

  // Strip trailing padding before substituting, so NUL padding never turns into '?'.
  while (!s.empty() && (s.back() == '\0' || s.back() == ' ')) {
    s.pop_back();
  }
  for (char& c : s) {
    c = printable(static_cast<uint8_t>(c));
  }

  if (out) *out = std::move(s);
  return true;
}

bool decoder::decode_scaled(const uint16_t* words, size_t count, bool is_signed, ByteLane lane,
                            Scale scale, double* out, Fault* fault) {
  if (!words || count != 1) return length_fault(fault, "scaled_length_mismatch");
  if (scale.den == 0) return length_fault(fault, "scale_zero_denominator");

  const int32_t raw = lane_value(words[0], is_signed, lane);
  if (out) {
    *out = static_cast<double>(raw) * static_cast<double>(scale.num) / static_cast<double>(scale.den);
  }
  return true;
}

bool decoder::decode_version(const uint16_t* words, size_t count, std::string* out, Fault* fault) {
  if (!words || count != 2) return length_fault(fault, "version_length_mismatch");

  // bytes: [w0.hi, w0.lo, w1.hi, w1.lo]; w0.hi is reserved.
  const unsigned b1 = words[0] & 0xFF;
  const unsigned b2 = words[1] >> 8;
  const unsigned b3 = words[1] & 0xFF;

  char buf[24];
  snprintf(buf, sizeof(buf), "V%u.%u.%u", b1, b2, b3);
  if (out) *out = buf;
  return true;
}

bool decoder::decode_hex(const uint16_t* words, size_t count, size_t expected, std::string* out,
                         Fault* fault) {
  if (!words || count == 0 || count != expected) return length_fault(fault, "hex_length_mismatch");

  std::string s;
  s.reserve(count * 4);
  char buf[8];
  for (size_t i = 0; i < count; ++i) {
    snprintf(buf, sizeof(buf), "%04X", static_cast<unsigned>(words[i]));
    s += buf;
  }
  if (out) *out = std::move(s);
  return true;
}

bool decoder::decode(const RegisterSpec& spec, const uint16_t* words, size_t count, RegisterValue* out,
                     Fault* fault) {
  if (!spec_valid(spec)) return length_fault(fault, "invalid_register_spec");

  RegisterValue v;
  bool ok = false;
  switch (spec.decode) {
    case DecodeMethod::BIG_ENDIAN_ASCII:
      v.type = RegisterValue::Type::TEXT;
      ok = decode_ascii(words, count, spec.word_count, &v.text, fault);
      break;
    case DecodeMethod::SCALED_UNSIGNED:
      ok = decode_scaled(words, count, false, spec.lane, spec.scale, &v.number, fault);
      break;
    case DecodeMethod::SCALED_SIGNED:
      ok = decode_scaled(words, count, true, spec.lane, spec.scale, &v.number, fault);
      break;
    case DecodeMethod::VERSION_TRIPLET:
      v.type = RegisterValue::Type::TEXT;
      ok = decode_version(words, count, &v.text, fault);
      break;
    case DecodeMethod::HEX_WORDS:
      v.type = RegisterValue::Type::TEXT;
      ok = decode_hex(words, count, spec.word_count, &v.text, fault);
      break;
    default:
      return length_fault(fault, "unknown_decode_method");
  }

  if (ok && out) *out = std::move(v);
  return ok;
}
