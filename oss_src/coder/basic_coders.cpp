/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <logger/logger.hpp>
#include <exceptions/error_types.hpp>
#include <coder/basic_coders.hpp>

namespace dataflow {

static const size_t MAX_VARINT_BYTES = 10;

void append_varint(std::string& out, uint64_t value) {
  while (value >= 0x80) {
    out.push_back((char)((value & 0x7F) | 0x80));
    value >>= 7;
  }
  out.push_back((char)value);
}

size_t read_varint(const std::string& bytes, size_t pos, uint64_t& value) {
  value = 0;
  size_t shift = 0;
  for (size_t i = 0; i < MAX_VARINT_BYTES; ++i) {
    if (pos >= bytes.size()) {
      std_log_and_throw(decode_error,
                        "Truncated varint at byte " << pos << " of "
                        << bytes.size());
    }
    unsigned char c = (unsigned char)bytes[pos++];
    // the tenth byte holds only the top bit of a 64 bit value
    if (i == MAX_VARINT_BYTES - 1 && (c & 0x7E) != 0) {
      std_log_and_throw(decode_error, "Varint overflows 64 bits");
    }
    value |= (uint64_t)(c & 0x7F) << shift;
    if ((c & 0x80) == 0) return pos;
    shift += 7;
  }
  std_log_and_throw(decode_error,
                    "Varint longer than " << MAX_VARINT_BYTES << " bytes");
}

/**************************************************************************/
/*                                                                        */
/*                           string_utf8_coder                            */
/*                                                                        */
/**************************************************************************/

std::string string_utf8_coder::encode(const std::string& value) const {
  return value;
}

std::string string_utf8_coder::decode(const std::string& bytes) const {
  size_t i = 0;
  while (i < bytes.size()) {
    unsigned char c = (unsigned char)bytes[i];
    size_t len;
    uint32_t codepoint;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2; codepoint = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3; codepoint = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4; codepoint = c & 0x07;
    } else {
      std_log_and_throw(decode_error,
                        "Invalid UTF-8 lead byte at offset " << i);
    }
    if (i + len > bytes.size()) {
      std_log_and_throw(decode_error,
                        "Truncated UTF-8 sequence at offset " << i);
    }
    for (size_t j = 1; j < len; ++j) {
      unsigned char cc = (unsigned char)bytes[i + j];
      if ((cc & 0xC0) != 0x80) {
        std_log_and_throw(decode_error,
                          "Invalid UTF-8 continuation byte at offset "
                          << (i + j));
      }
      codepoint = (codepoint << 6) | (cc & 0x3F);
    }
    static const uint32_t min_codepoint[5] = {0, 0, 0x80, 0x800, 0x10000};
    if (codepoint < min_codepoint[len] || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      std_log_and_throw(decode_error,
                        "Invalid UTF-8 code point at offset " << i);
    }
    i += len;
  }
  return bytes;
}

/**************************************************************************/
/*                                                                        */
/*                            var_int64_coder                             */
/*                                                                        */
/**************************************************************************/

std::string var_int64_coder::encode(const int64_t& value) const {
  std::string out;
  append_varint(out, (uint64_t)value);
  return out;
}

int64_t var_int64_coder::decode(const std::string& bytes) const {
  if (bytes.empty()) {
    std_log_and_throw(decode_error, "Cannot decode an integer from 0 bytes");
  }
  uint64_t value;
  size_t end = read_varint(bytes, 0, value);
  if (end != bytes.size()) {
    std_log_and_throw(decode_error,
                      (bytes.size() - end) << " trailing bytes after varint");
  }
  return (int64_t)value;
}

/**************************************************************************/
/*                                                                        */
/*                         big_endian_int32_coder                         */
/*                                                                        */
/**************************************************************************/

std::string big_endian_int32_coder::encode(const int32_t& value) const {
  uint32_t v = (uint32_t)value;
  std::string out(4, '\0');
  out[0] = (char)((v >> 24) & 0xFF);
  out[1] = (char)((v >> 16) & 0xFF);
  out[2] = (char)((v >> 8) & 0xFF);
  out[3] = (char)(v & 0xFF);
  return out;
}

int32_t big_endian_int32_coder::decode(const std::string& bytes) const {
  if (bytes.size() != 4) {
    std_log_and_throw(decode_error,
                      "Expected 4 bytes for a 32 bit integer, got "
                      << bytes.size());
  }
  uint32_t v = 0;
  for (size_t i = 0; i < 4; ++i) {
    v = (v << 8) | (unsigned char)bytes[i];
  }
  return (int32_t)v;
}

} // namespace dataflow
