/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <source/progress.hpp>

namespace dataflow {

progress make_progress(const position& pos) {
  progress ret;
  ret.pos = pos;
  return ret;
}

bool operator==(const progress& a, const progress& b) {
  return a.pos == b.pos &&
         a.percent_complete == b.percent_complete &&
         a.remaining_time == b.remaining_time;
}

std::ostream& operator<<(std::ostream& out, const progress& p) {
  out << "progress{";
  bool first = true;
  if (p.pos) {
    out << "position=" << *p.pos;
    first = false;
  }
  if (p.percent_complete) {
    out << (first ? "" : ", ") << "percent_complete=" << *p.percent_complete;
    first = false;
  }
  if (p.remaining_time) {
    out << (first ? "" : ", ") << "remaining_time=" << *p.remaining_time;
  }
  return out << "}";
}

} // namespace dataflow
