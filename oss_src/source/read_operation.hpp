/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_READ_OPERATION_HPP
#define DATAFLOW_SOURCE_READ_OPERATION_HPP
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <boost/optional.hpp>
#include <logger/logger.hpp>
#include <exceptions/error_types.hpp>
#include <parallel/pthread_tools.hpp>
#include <timer/timer.hpp>
#include <source/source.hpp>
#include <source/source_config.hpp>
#include <source/source_observer.hpp>

namespace dataflow {

/**
 * \ingroup source
 * Reads a whole source, handing every element to a receiver.
 *
 * run() is called once, on the worker thread, and returns when the source
 * is exhausted (which may be early, if its stop position was moved).
 * While it runs, get_progress() and request_dynamic_split() may be called
 * from any other thread, e.g. by the task reporting status to the service.
 *
 * \code
 * read_operation<int64_t> op(src, [&](const int64_t& v) { sum += v; },
 *                            "ReadNumbers");
 * std::thread reader([&]() { op.run(); });
 * ...
 * auto stop = op.request_dynamic_split(make_progress(
 *                                        make_record_index_position(500)));
 * reader.join();
 * \endcode
 */
template <typename T>
class read_operation {
 public:
  typedef std::function<void(const T&)> receiver_type;

  read_operation(std::shared_ptr<const source<T> > src,
                 receiver_type receiver,
                 std::string name = "read")
      : m_source(src), m_receiver(receiver), m_name(name),
        m_counters(std::make_shared<read_counters>()) {
    if (!m_source) {
      std_log_and_throw(invalid_argument,
                        "read_operation " << m_name << " requires a source");
    }
    if (!m_receiver) {
      std_log_and_throw(invalid_argument,
                        "read_operation " << m_name << " requires a receiver");
    }
  }

  /**
   * Opens the source and reads it to the end. Exceptions thrown by the
   * iterator or by the receiver propagate out of run(); elements received
   * before the exception stay received. Throws invalid_argument if called
   * more than once.
   */
  void run() {
    {
      std::lock_guard<mutex> guard(m_lock);
      if (m_started) {
        std_log_and_throw(invalid_argument,
                          "read_operation " << m_name << " has already run");
      }
      m_started = true;
    }

    std::shared_ptr<source_iterator<T> > iter(m_source->open());
    iter->add_observer(m_counters);
    {
      std::lock_guard<mutex> guard(m_lock);
      m_iterator = iter;
    }

    timer ti;
    size_t log_interval = source_config::SOURCE_PROGRESS_LOG_INTERVAL;
    size_t count = 0;
    // a split between has_next() and next() cannot make next() fail: an
    // accepted stop position is always after the current index.
    while (iter->has_next()) {
      m_receiver(iter->next());
      ++count;
      if (log_interval > 0 && count % log_interval == 0) {
        logstream(LOG_INFO) << m_name << ": read " << count
                            << " elements, now at " << iter->get_progress()
                            << std::endl;
      }
    }
    logstream(LOG_INFO) << m_name << ": finished reading " << count
                        << " elements (" << m_counters->bytes_read()
                        << " bytes) in " << ti.current_time() << "s"
                        << std::endl;
  }

  /**
   * Progress of the running (or finished) read. None if run() has not yet
   * opened the source.
   */
  boost::optional<progress> get_progress() const {
    std::shared_ptr<source_iterator<T> > iter = current_iterator();
    if (!iter) return boost::none;
    return iter->get_progress();
  }

  /**
   * Asks the running read to stop at the proposed position. Returns the
   * accepted stop position, or none if the proposal was rejected or run()
   * has not yet opened the source.
   */
  boost::optional<position> request_dynamic_split(const progress& proposed) {
    std::shared_ptr<source_iterator<T> > iter = current_iterator();
    if (!iter) {
      logstream(LOG_WARNING) << m_name << ": cannot split " << proposed
                             << " before the read has started" << std::endl;
      return boost::none;
    }
    return iter->update_stop_position(proposed);
  }

  size_t elements_read() const { return m_counters->elements_read(); }

  size_t bytes_read() const { return m_counters->bytes_read(); }

  const std::string& name() const { return m_name; }

 private:
  std::shared_ptr<const source<T> > m_source;
  receiver_type m_receiver;
  std::string m_name;
  std::shared_ptr<read_counters> m_counters;

  mutable mutex m_lock;
  bool m_started = false;
  std::shared_ptr<source_iterator<T> > m_iterator;

  std::shared_ptr<source_iterator<T> > current_iterator() const {
    std::lock_guard<mutex> guard(m_lock);
    return m_iterator;
  }
};

} // namespace dataflow
#endif
