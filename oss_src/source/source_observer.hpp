/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_SOURCE_OBSERVER_HPP
#define DATAFLOW_SOURCE_SOURCE_OBSERVER_HPP
#include <cstddef>
#include <memory>
#include <vector>
#include <parallel/atomic.hpp>

namespace dataflow {

/**
 * \ingroup source
 * Receives a notification from a source iterator each time it has read
 * elements. Called on the consumer thread, from inside next(); an
 * implementation must be cheap and must not call back into the iterator.
 */
class source_observer {
 public:
  virtual ~source_observer() { }

  /**
   * count elements were read, whose encoded form totalled byte_length
   * bytes.
   */
  virtual void on_elements_read(size_t count, size_t byte_length) = 0;
};

/**
 * A source_observer which keeps running totals. The totals may be read from
 * any thread while the iterator runs.
 */
class read_counters : public source_observer {
 public:
  void on_elements_read(size_t count, size_t byte_length) {
    m_elements_read.inc(count);
    m_bytes_read.inc(byte_length);
  }

  size_t elements_read() const { return m_elements_read; }

  size_t bytes_read() const { return m_bytes_read; }

 private:
  atomic<size_t> m_elements_read;
  atomic<size_t> m_bytes_read;
};

/**
 * The list of observers attached to one iterator. Observers must be added
 * before iteration starts; notify() is only called by the consumer.
 */
class source_observer_list {
 public:
  void add(std::shared_ptr<source_observer> observer) {
    if (observer) m_observers.push_back(observer);
  }

  void notify(size_t count, size_t byte_length) const {
    for (const auto& observer : m_observers) {
      observer->on_elements_read(count, byte_length);
    }
  }

  size_t size() const { return m_observers.size(); }

 private:
  std::vector<std::shared_ptr<source_observer> > m_observers;
};

} // namespace dataflow
#endif
