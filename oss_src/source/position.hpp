/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_POSITION_HPP
#define DATAFLOW_SOURCE_POSITION_HPP
#include <cstdint>
#include <string>
#include <iostream>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace dataflow {

/// The index of a record within the record sequence of a source.
struct record_index_position {
  int64_t record_index;
};

/// A byte offset into the underlying storage of a source.
struct byte_offset_position {
  int64_t byte_offset;
};

/// A position in a key ordered source, such as a shuffle.
struct key_position {
  std::string key;
};

inline bool operator==(const record_index_position& a,
                       const record_index_position& b) {
  return a.record_index == b.record_index;
}
inline bool operator<(const record_index_position& a,
                      const record_index_position& b) {
  return a.record_index < b.record_index;
}
inline bool operator==(const byte_offset_position& a,
                       const byte_offset_position& b) {
  return a.byte_offset == b.byte_offset;
}
inline bool operator<(const byte_offset_position& a,
                      const byte_offset_position& b) {
  return a.byte_offset < b.byte_offset;
}
inline bool operator==(const key_position& a, const key_position& b) {
  return a.key == b.key;
}
inline bool operator<(const key_position& a, const key_position& b) {
  return a.key < b.key;
}

std::ostream& operator<<(std::ostream& out, const record_index_position& p);
std::ostream& operator<<(std::ostream& out, const byte_offset_position& p);
std::ostream& operator<<(std::ostream& out, const key_position& p);

/**
 * \ingroup source
 * A location within the record space of a source.
 *
 * A position is one of several encodings. A source interprets the kinds it
 * understands and treats every other kind as unsupported; new kinds can be
 * added here without changing the split protocol.
 *
 * Positions of the same kind are ordered by value. Positions of different
 * kinds are ordered by kind, which only serves to make position usable as a
 * key; it carries no meaning.
 */
typedef boost::variant<record_index_position,
                       byte_offset_position,
                       key_position> position;

/// Constructs a record index position.
position make_record_index_position(int64_t record_index);

/// Constructs a byte offset position.
position make_byte_offset_position(int64_t byte_offset);

/// Constructs a key position.
position make_key_position(const std::string& key);

/**
 * Returns the record index of the position, or none if the position is not
 * a record index position.
 */
boost::optional<int64_t> get_record_index(const position& pos);

/// Name of the position's kind: "record_index", "byte_offset" or "key".
const char* position_kind(const position& pos);

} // namespace dataflow
#endif
