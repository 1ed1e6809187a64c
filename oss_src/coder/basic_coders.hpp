/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_CODER_BASIC_CODERS_HPP
#define DATAFLOW_CODER_BASIC_CODERS_HPP
#include <cstddef>
#include <cstdint>
#include <string>
#include <coder/coder.hpp>

namespace dataflow {

/**
 * Appends the unsigned LEB128 encoding of value to out: seven bits per
 * byte, least significant group first, high bit set on every byte but the
 * last. At most 10 bytes.
 */
void append_varint(std::string& out, uint64_t value);

/**
 * Reads one varint from bytes starting at offset pos.
 * Stores the result in value and returns the offset one past the last byte
 * consumed. Throws decode_error if the input ends in the middle of the
 * varint or the varint is longer than 10 bytes.
 */
size_t read_varint(const std::string& bytes, size_t pos, uint64_t& value);

/**
 * Strings, encoded as their UTF-8 bytes. decode() rejects byte strings that
 * are not well formed UTF-8 (bad lead bytes, truncated sequences, overlong
 * forms, surrogates and code points above U+10FFFF).
 */
class string_utf8_coder : public coder<std::string> {
 public:
  std::string encode(const std::string& value) const;
  std::string decode(const std::string& bytes) const;
};

/**
 * 64 bit signed integers, encoded as the varint of their two's complement
 * bit pattern. Small non-negative numbers are short; negative numbers always
 * take 10 bytes.
 */
class var_int64_coder : public coder<int64_t> {
 public:
  std::string encode(const int64_t& value) const;
  int64_t decode(const std::string& bytes) const;
};

/**
 * 32 bit signed integers, encoded as exactly 4 bytes, most significant
 * byte first.
 */
class big_endian_int32_coder : public coder<int32_t> {
 public:
  std::string encode(const int32_t& value) const;
  int32_t decode(const std::string& bytes) const;
};

} // namespace dataflow
#endif
