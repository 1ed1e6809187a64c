/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_SOURCE_HPP
#define DATAFLOW_SOURCE_SOURCE_HPP
#include <memory>
#include <boost/optional.hpp>
#include <source/position.hpp>
#include <source/progress.hpp>
#include <source/source_observer.hpp>

namespace dataflow {

/**
 * \ingroup source
 * The outcome of a proposal to move the stop position of an iterator.
 */
enum class split_decision {
  /// The stop position was moved to the proposed position.
  ACCEPTED,
  /// The proposal carried no position, or one of a kind the source does
  /// not understand.
  UNSUPPORTED_POSITION,
  /// The proposed position is at or before the current read position.
  NOT_AFTER_CURRENT_POSITION,
  /// The proposed position is at or after the current stop position, so
  /// accepting it would not shrink the range.
  NOT_BEFORE_STOP_POSITION
};

const char* split_decision_name(split_decision decision);

/**
 * The result of source_iterator::propose_stop_position(). stop_position is
 * set iff decision is ACCEPTED.
 */
struct split_result {
  split_decision decision;
  boost::optional<position> stop_position;

  bool accepted() const { return decision == split_decision::ACCEPTED; }

  static split_result accept(const position& pos) {
    split_result ret;
    ret.decision = split_decision::ACCEPTED;
    ret.stop_position = pos;
    return ret;
  }

  static split_result reject(split_decision reason) {
    split_result ret;
    ret.decision = reason;
    return ret;
  }
};

/**
 * \ingroup source
 * A cursor over the elements of a source.
 *
 * One consumer thread calls has_next() and next(). Concurrently, one or more
 * control threads may call get_progress() and update_stop_position() /
 * propose_stop_position(); implementations must make these safe against
 * the consumer.
 *
 * The stop position only ever moves backwards. An accepted stop position is
 * always strictly after every element already returned or being returned by
 * next(), so no element on either side of a split is lost or read twice.
 */
template <typename T>
class source_iterator {
 public:
  typedef T value_type;

  virtual ~source_iterator() { }

  /// True if next() will return an element.
  virtual bool has_next() const = 0;

  /**
   * Returns the next element and advances.
   * Throws no_such_element if has_next() is false, and decode_error if the
   * element cannot be decoded (in which case the iterator does not advance).
   */
  virtual T next() = 0;

  /// A snapshot of the current read position.
  virtual progress get_progress() const = 0;

  /**
   * Proposes a new stop position, and reports why a rejected proposal was
   * rejected. Rejection is not an error.
   */
  virtual split_result propose_stop_position(const progress& proposed) = 0;

  /**
   * Proposes a new stop position. Returns the accepted stop position, or
   * none if the proposal was rejected.
   */
  boost::optional<position> update_stop_position(const progress& proposed) {
    return propose_stop_position(proposed).stop_position;
  }

  /**
   * Attaches an observer which is notified of every element read. Must be
   * called before the first call to next().
   */
  virtual void add_observer(std::shared_ptr<source_observer> observer) = 0;
};

/**
 * \ingroup source
 * A readable collection of elements. Sources are immutable; every call to
 * open() returns a new, independent iterator starting at the beginning of
 * the source.
 */
template <typename T>
class source {
 public:
  typedef T value_type;

  virtual ~source() { }

  virtual std::unique_ptr<source_iterator<T> > open() const = 0;
};

} // namespace dataflow
#endif
