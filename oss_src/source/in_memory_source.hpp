/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_IN_MEMORY_SOURCE_HPP
#define DATAFLOW_SOURCE_IN_MEMORY_SOURCE_HPP
#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <logger/logger.hpp>
#include <logger/assertions.hpp>
#include <exceptions/error_types.hpp>
#include <parallel/pthread_tools.hpp>
#include <coder/coder.hpp>
#include <source/source.hpp>

namespace dataflow {

template <typename T>
class in_memory_source_iterator;

/**
 * \ingroup source
 * A source over a contiguous range [start_index, end_index) of a list of
 * encoded records held in memory. Each record is decoded with the source's
 * coder as it is read.
 *
 * The record list and the coder are shared, never copied, by the source and
 * all iterators opened on it, and must not be modified while they are in
 * use.
 *
 * \code
 * auto records = std::make_shared<std::vector<std::string> >();
 * // ... fill records ...
 * in_memory_source<int64_t> src(records, 0, boost::none,
 *                               std::make_shared<var_int64_coder>());
 * auto iter = src.open();
 * while (iter->has_next()) process(iter->next());
 * \endcode
 */
template <typename T>
class in_memory_source : public source<T> {
 public:
  typedef std::vector<std::string> record_list;

  /**
   * Constructs the source.
   *
   * \param records The encoded records.
   * \param start_index First record of the range. Defaults to 0. Must not be
   *                    negative; clamped to the number of records.
   * \param end_index One past the last record of the range. Defaults to the
   *                  number of records. Must not be less than the resolved
   *                  start index; clamped to the number of records.
   * \param element_coder Decodes each record.
   *
   * Throws invalid_argument if a bound is out of order, or if records or
   * element_coder is null.
   */
  in_memory_source(std::shared_ptr<const record_list> records,
                   boost::optional<int64_t> start_index,
                   boost::optional<int64_t> end_index,
                   std::shared_ptr<const coder<T> > element_coder)
      : m_records(records), m_coder(element_coder) {
    if (!m_records) {
      std_log_and_throw(invalid_argument,
                        "in_memory_source requires a record list");
    }
    if (!m_coder) {
      std_log_and_throw(invalid_argument, "in_memory_source requires a coder");
    }
    int64_t max_index = (int64_t)m_records->size();
    if (!start_index) {
      m_start_index = 0;
    } else {
      if (*start_index < 0) {
        std_log_and_throw(invalid_argument,
                          "start index should be >= 0, got " << *start_index);
      }
      m_start_index = (size_t)std::min(*start_index, max_index);
    }
    if (!end_index) {
      m_end_index = (size_t)max_index;
    } else {
      if (*end_index < (int64_t)m_start_index) {
        std_log_and_throw(invalid_argument,
                          "end index should be >= start index, got "
                          << *end_index << " < " << m_start_index);
      }
      m_end_index = (size_t)std::min(*end_index, max_index);
    }
  }

  /// The resolved first record of the range.
  size_t start_index() const { return m_start_index; }

  /// The resolved end (exclusive) of the range.
  size_t end_index() const { return m_end_index; }

  /// The number of records in the backing list, in or out of range.
  size_t num_records() const { return m_records->size(); }

  std::unique_ptr<source_iterator<T> > open() const {
    return std::unique_ptr<source_iterator<T> >(make_iterator().release());
  }

  /**
   * Same as open(), but returns the concrete iterator type, which also
   * exposes the current read and stop positions as indices.
   */
  std::unique_ptr<in_memory_source_iterator<T> > make_iterator() const {
    logstream(LOG_DEBUG) << "Opening in_memory_source over records ["
                         << m_start_index << ", " << m_end_index << ")"
                         << std::endl;
    return std::unique_ptr<in_memory_source_iterator<T> >(
        new in_memory_source_iterator<T>(m_records, m_coder,
                                         m_start_index, m_end_index));
  }

 private:
  std::shared_ptr<const record_list> m_records;
  std::shared_ptr<const coder<T> > m_coder;
  size_t m_start_index;
  size_t m_end_index;
};


/**
 * \ingroup source
 * The iterator of an in_memory_source. Reads records [index, end_position)
 * in order, where index starts at the source's start index and end_position
 * starts at the source's end index.
 *
 * index and end_position are both guarded by one lock, so progress queries
 * and stop position proposals from other threads always see a consistent
 * pair. The lock is not held while a record is being decoded; this is safe
 * because a stop position is only accepted strictly after index, so the
 * record being decoded is never given away.
 */
template <typename T>
class in_memory_source_iterator : public source_iterator<T> {
 public:
  typedef std::vector<std::string> record_list;

  in_memory_source_iterator(std::shared_ptr<const record_list> records,
                            std::shared_ptr<const coder<T> > element_coder,
                            size_t start_index,
                            size_t end_index)
      : m_records(records), m_coder(element_coder),
        m_index(start_index), m_end_position(end_index) {
    DASSERT_LE(start_index, end_index);
    DASSERT_LE(end_index, records->size());
  }

  bool has_next() const {
    std::lock_guard<mutex> guard(m_lock);
    return m_index < m_end_position;
  }

  T next() {
    size_t index;
    {
      std::lock_guard<mutex> guard(m_lock);
      if (m_index >= m_end_position) {
        std_log_and_throw(no_such_element,
                          "No element at index " << m_index
                          << ": iterator stops at " << m_end_position);
      }
      index = m_index;
    }

    const std::string& encoded = (*m_records)[index];
    T value = decode_record(index, encoded);

    {
      std::lock_guard<mutex> guard(m_lock);
      DASSERT_EQ(m_index, index);
      DASSERT_LT(m_index, m_end_position);
      ++m_index;
    }
    m_observers.notify(1, encoded.size());
    return value;
  }

  /**
   * Reports the index of the next record to be read. Only the position is
   * filled in.
   */
  progress get_progress() const {
    std::lock_guard<mutex> guard(m_lock);
    return make_progress(make_record_index_position((int64_t)m_index));
  }

  /**
   * Accepts a record index strictly between the current index and the
   * current end position, and makes it the new end position. Everything
   * else is rejected and leaves the iterator unchanged.
   */
  split_result propose_stop_position(const progress& proposed) {
    if (!proposed.pos) {
      logstream(LOG_WARNING) << "A stop position without a position is not "
                                "supported" << std::endl;
      return split_result::reject(split_decision::UNSUPPORTED_POSITION);
    }
    boost::optional<int64_t> record_index = get_record_index(*proposed.pos);
    if (!record_index) {
      logstream(LOG_WARNING) << "A stop position of kind "
                             << position_kind(*proposed.pos)
                             << " is not supported by in_memory_source"
                             << std::endl;
      return split_result::reject(split_decision::UNSUPPORTED_POSITION);
    }

    size_t index, previous_end;
    {
      std::lock_guard<mutex> guard(m_lock);
      index = m_index;
      previous_end = m_end_position;
      if (*record_index <= (int64_t)m_index) {
        logstream(LOG_DEBUG) << "Rejected stop position " << *record_index
                             << ": not after current index " << m_index
                             << std::endl;
        return split_result::reject(split_decision::NOT_AFTER_CURRENT_POSITION);
      }
      if (*record_index >= (int64_t)m_end_position) {
        logstream(LOG_DEBUG) << "Rejected stop position " << *record_index
                             << ": not before current stop position "
                             << m_end_position << std::endl;
        return split_result::reject(split_decision::NOT_BEFORE_STOP_POSITION);
      }
      m_end_position = (size_t)(*record_index);
    }
    logstream(LOG_INFO) << "Moved stop position from " << previous_end
                        << " to " << *record_index << " at index " << index
                        << std::endl;
    return split_result::accept(make_record_index_position(*record_index));
  }

  void add_observer(std::shared_ptr<source_observer> observer) {
    m_observers.add(observer);
  }

  /// The index of the next record to be read.
  size_t current_index() const {
    std::lock_guard<mutex> guard(m_lock);
    return m_index;
  }

  /// The current exclusive end of the range.
  size_t end_position() const {
    std::lock_guard<mutex> guard(m_lock);
    return m_end_position;
  }

 private:
  std::shared_ptr<const record_list> m_records;
  std::shared_ptr<const coder<T> > m_coder;
  source_observer_list m_observers;

  T decode_record(size_t index, const std::string& encoded) const {
    try {
      return m_coder->decode(encoded);
    } catch (const decode_error& e) {
      // the coder has already logged the failure
      std::ostringstream ss;
      ss << "Cannot decode record " << index << ": " << e.what();
      throw decode_error(ss.str());
    }
  }

  mutable mutex m_lock;
  size_t m_index;
  size_t m_end_position;
};

} // namespace dataflow
#endif
