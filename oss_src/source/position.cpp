/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <source/position.hpp>

namespace dataflow {

std::ostream& operator<<(std::ostream& out, const record_index_position& p) {
  return out << "record_index(" << p.record_index << ")";
}

std::ostream& operator<<(std::ostream& out, const byte_offset_position& p) {
  return out << "byte_offset(" << p.byte_offset << ")";
}

std::ostream& operator<<(std::ostream& out, const key_position& p) {
  return out << "key(\"" << p.key << "\")";
}

position make_record_index_position(int64_t record_index) {
  record_index_position p;
  p.record_index = record_index;
  return p;
}

position make_byte_offset_position(int64_t byte_offset) {
  byte_offset_position p;
  p.byte_offset = byte_offset;
  return p;
}

position make_key_position(const std::string& key) {
  key_position p;
  p.key = key;
  return p;
}

namespace {
struct position_kind_visitor : public boost::static_visitor<const char*> {
  const char* operator()(const record_index_position&) const {
    return "record_index";
  }
  const char* operator()(const byte_offset_position&) const {
    return "byte_offset";
  }
  const char* operator()(const key_position&) const {
    return "key";
  }
};
} // anonymous namespace

boost::optional<int64_t> get_record_index(const position& pos) {
  const record_index_position* p = boost::get<record_index_position>(&pos);
  if (p == NULL) return boost::none;
  return p->record_index;
}

const char* position_kind(const position& pos) {
  return boost::apply_visitor(position_kind_visitor(), pos);
}

} // namespace dataflow
