/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_PROGRESS_HPP
#define DATAFLOW_SOURCE_PROGRESS_HPP
#include <iostream>
#include <boost/optional.hpp>
#include <source/position.hpp>

namespace dataflow {

/**
 * \ingroup source
 * A snapshot of how far an iterator has advanced. Every field is optional;
 * a source fills in what it can measure.
 *
 * The same type carries proposed stop positions to
 * source_iterator::update_stop_position(), in which case only the position
 * is meaningful.
 */
struct progress {
  /// The current (or proposed) position.
  boost::optional<position> pos;

  /// Fraction of the source consumed, in [0, 1].
  boost::optional<double> percent_complete;

  /// Estimated time to consume the rest of the source, in seconds.
  boost::optional<double> remaining_time;
};

/// A progress consisting of just a position.
progress make_progress(const position& pos);

bool operator==(const progress& a, const progress& b);
inline bool operator!=(const progress& a, const progress& b) {
  return !(a == b);
}

std::ostream& operator<<(std::ostream& out, const progress& p);

} // namespace dataflow
#endif
