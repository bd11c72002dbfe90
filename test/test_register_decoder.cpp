#include <unity.h>

#include <string>

#include "core/register_decoder.h"

void test_ascii_strips_trailing_padding() {
  const uint16_t words[] = {0x5244, 0x2D31, 0x2000, 0x0000}; // "RD-1 \0\0\0"
  std::string out;
  Fault fault;

  TEST_ASSERT_TRUE(decoder::decode_ascii(words, 4, 4, &out, &fault));
  TEST_ASSERT_EQUAL_STRING("RD-1", out.c_str());
  TEST_ASSERT_TRUE(fault.ok());
}

void test_ascii_replaces_non_printable_bytes() {
  const uint16_t words[] = {0x4101, 0x7F42}; // 'A' 0x01 0x7F 'B'
  std::string out;

  TEST_ASSERT_TRUE(decoder::decode_ascii(words, 2, 2, &out, nullptr));
  TEST_ASSERT_EQUAL_STRING("A??B", out.c_str());
}

void test_ascii_length_mismatch_is_decode_fault() {
  const uint16_t words[] = {0x4142, 0x4344};
  std::string out = "untouched";
  Fault fault;

  TEST_ASSERT_FALSE(decoder::decode_ascii(words, 2, 8, &out, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
  TEST_ASSERT_EQUAL_STRING("ascii_length_mismatch", fault.reason);
  TEST_ASSERT_EQUAL_STRING("untouched", out.c_str());
}

void test_version_triplet_uses_low_three_bytes() {
  const uint16_t words[] = {0x0102, 0x0304};
  std::string out;

  TEST_ASSERT_TRUE(decoder::decode_version(words, 2, &out, nullptr));
  TEST_ASSERT_EQUAL_STRING("V2.3.4", out.c_str());
}

void test_version_rejects_single_word() {
  const uint16_t words[] = {0x0102};
  std::string out;
  Fault fault;

  TEST_ASSERT_FALSE(decoder::decode_version(words, 1, &out, &fault));
  TEST_ASSERT_EQUAL_STRING("version_length_mismatch", fault.reason);
}

void test_scaled_unsigned_applies_rational_scale() {
  const uint16_t words[] = {250};
  double v = 0;

  TEST_ASSERT_TRUE(decoder::decode_scaled(words, 1, false, ByteLane::WORD, Scale {1, 10}, &v, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 25.0f, static_cast<float>(v));

  const uint16_t hundredths[] = {523};
  TEST_ASSERT_TRUE(decoder::decode_scaled(hundredths, 1, false, ByteLane::WORD, Scale {1, 100}, &v, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 5.23f, static_cast<float>(v));
}

void test_signed_byte_lane_is_sign_magnitude() {
  const uint16_t words[] = {0x1985}; // hi 25, lo 0x85
  double controller = 0;
  double battery = 0;

  TEST_ASSERT_TRUE(decoder::decode_scaled(words, 1, true, ByteLane::HIGH_BYTE, Scale {}, &controller, nullptr));
  TEST_ASSERT_TRUE(decoder::decode_scaled(words, 1, true, ByteLane::LOW_BYTE, Scale {}, &battery, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 25.0f, static_cast<float>(controller));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, -5.0f, static_cast<float>(battery));
}

void test_unsigned_byte_lane_keeps_high_bit() {
  const uint16_t words[] = {0x0085};
  double v = 0;

  TEST_ASSERT_TRUE(decoder::decode_scaled(words, 1, false, ByteLane::LOW_BYTE, Scale {}, &v, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 133.0f, static_cast<float>(v));
}

void test_signed_word_is_twos_complement() {
  const uint16_t words[] = {0xFFF6};
  double v = 0;

  TEST_ASSERT_TRUE(decoder::decode_scaled(words, 1, true, ByteLane::WORD, Scale {1, 10}, &v, nullptr));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, -1.0f, static_cast<float>(v));
}

void test_zero_denominator_is_fault() {
  const uint16_t words[] = {10};
  double v = 0;
  Fault fault;

  TEST_ASSERT_FALSE(decoder::decode_scaled(words, 1, false, ByteLane::WORD, Scale {1, 0}, &v, &fault));
  TEST_ASSERT_EQUAL_STRING("scale_zero_denominator", fault.reason);
}

void test_hex_words_render_uppercase() {
  const uint16_t words[] = {0x00AB, 0xCDEF};
  std::string out;

  TEST_ASSERT_TRUE(decoder::decode_hex(words, 2, 2, &out, nullptr));
  TEST_ASSERT_EQUAL_STRING("00ABCDEF", out.c_str());
}

void test_decode_dispatches_on_register_spec() {
  const RegisterSpec model {"model", 0x000C, 2, DecodeMethod::BIG_ENDIAN_ASCII, ByteLane::WORD, {1, 1}, ""};
  const uint16_t words[] = {0x4142, 0x4300};
  RegisterValue v;

  TEST_ASSERT_TRUE(decoder::decode(model, words, 2, &v, nullptr));
  TEST_ASSERT_FALSE(v.is_number());
  TEST_ASSERT_EQUAL_STRING("ABC", v.text.c_str());
}

void test_decode_rejects_inconsistent_register_spec() {
  const RegisterSpec bad {"bad", 0x0014, 1, DecodeMethod::VERSION_TRIPLET, ByteLane::WORD, {1, 1}, ""};
  const RegisterSpec lane_on_text {"bad", 0x000C, 2, DecodeMethod::HEX_WORDS, ByteLane::HIGH_BYTE, {1, 1}, ""};
  const uint16_t words[] = {0x0102, 0x0304};
  RegisterValue v;
  Fault fault;

  TEST_ASSERT_FALSE(decoder::decode(bad, words, 1, &v, &fault));
  TEST_ASSERT_EQUAL_STRING("invalid_register_spec", fault.reason);
  TEST_ASSERT_FALSE(decoder::decode(lane_on_text, words, 2, &v, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
}

void test_every_method_rejects_extra_words() {
  const uint16_t words[] = {0x0102, 0x0304, 0x0506};
  std::string text = "untouched";
  double number = 42.0;
  Fault fault;

  TEST_ASSERT_FALSE(decoder::decode_ascii(words, 3, 2, &text, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
  TEST_ASSERT_EQUAL_STRING("ascii_length_mismatch", fault.reason);

  fault = Fault {};
  TEST_ASSERT_FALSE(decoder::decode_scaled(words, 2, false, ByteLane::WORD, Scale {}, &number, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
  TEST_ASSERT_EQUAL_STRING("scaled_length_mismatch", fault.reason);

  fault = Fault {};
  TEST_ASSERT_FALSE(decoder::decode_version(words, 3, &text, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
  TEST_ASSERT_EQUAL_STRING("version_length_mismatch", fault.reason);

  fault = Fault {};
  TEST_ASSERT_FALSE(decoder::decode_hex(words, 3, 2, &text, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
  TEST_ASSERT_EQUAL_STRING("hex_length_mismatch", fault.reason);

  TEST_ASSERT_EQUAL_STRING("untouched", text.c_str());
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 42.0f, static_cast<float>(number));
}

void test_decode_leaves_value_on_extra_words() {
  const RegisterSpec serial {"serial_number", 0x0018, 2, DecodeMethod::HEX_WORDS, ByteLane::WORD, {1, 1}, ""};
  const uint16_t words[] = {0x1234, 0xABCD, 0x0000};
  RegisterValue v;
  v.type = RegisterValue::Type::TEXT;
  v.text = "previous";
  Fault fault;

  TEST_ASSERT_FALSE(decoder::decode(serial, words, 3, &v, &fault));
  TEST_ASSERT_EQUAL(FaultKind::DECODE, fault.kind);
  TEST_ASSERT_EQUAL_STRING("previous", v.text.c_str());
}

// Re-encoding the decoded text, padded with spaces, yields the original words.
void test_ascii_reencodes_to_source_words() {
  const char* source = "RNG-CTRL-RVR20  ";
  uint16_t words[8];
  for (size_t i = 0; i < 8; ++i) {
    words[i] = static_cast<uint16_t>((static_cast<uint8_t>(source[2 * i]) << 8) | static_cast<uint8_t>(source[2 * i + 1]));
  }
  std::string text;

  TEST_ASSERT_TRUE(decoder::decode_ascii(words, 8, 8, &text, nullptr));
  TEST_ASSERT_EQUAL_STRING("RNG-CTRL-RVR20", text.c_str());

  text.resize(16, ' ');
  for (size_t i = 0; i < 8; ++i) {
    const uint16_t w = static_cast<uint16_t>((static_cast<uint8_t>(text[2 * i]) << 8) | static_cast<uint8_t>(text[2 * i + 1]));
    TEST_ASSERT_EQUAL_HEX16(words[i], w);
  }
}
