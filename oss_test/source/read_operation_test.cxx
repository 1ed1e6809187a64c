/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <boost/optional.hpp>
#include <coder/basic_coders.hpp>
#include <globals/globals.hpp>
#include <source/in_memory_source.hpp>
#include <source/read_operation.hpp>
#include <source/source_config.hpp>
#include <parallel/atomic.hpp>
#include <logger/log_level_setter.hpp>
#include <cxxtest/TestSuite.h>

using namespace dataflow;

typedef std::vector<std::string> record_list;

class read_operation_test: public CxxTest::TestSuite {
 private:
  static std::shared_ptr<const source<int64_t> > make_source(size_t n) {
    var_int64_coder c;
    auto records = std::make_shared<record_list>();
    for (size_t i = 0; i < n; ++i) records->push_back(c.encode(i));
    return std::make_shared<in_memory_source<int64_t> >(
        records, boost::none, boost::none,
        std::make_shared<var_int64_coder>());
  }

  static progress at(int64_t record_index) {
    return make_progress(make_record_index_position(record_index));
  }

 public:
  void test_reads_everything() {
    log_level_setter quiet(LOG_WARNING);
    std::vector<int64_t> received;
    read_operation<int64_t> op(make_source(1000),
                               [&](const int64_t& v) { received.push_back(v); },
                               "ReadAll");
    TS_ASSERT(!op.get_progress());
    op.run();
    TS_ASSERT_EQUALS(received.size(), 1000);
    for (size_t i = 0; i < received.size(); ++i) {
      TS_ASSERT_EQUALS(received[i], (int64_t)i);
    }
    TS_ASSERT_EQUALS(op.elements_read(), 1000);
    // 128 one-byte varints, the rest two bytes
    TS_ASSERT_EQUALS(op.bytes_read(), 128 + 2 * (1000 - 128));
    TS_ASSERT_EQUALS(op.name(), "ReadAll");

    boost::optional<progress> p = op.get_progress();
    TS_ASSERT(p);
    TS_ASSERT_EQUALS(*get_record_index(*p->pos), 1000);
  }

  void test_run_only_once() {
    log_level_setter quiet(LOG_NONE);
    read_operation<int64_t> op(make_source(3), [](const int64_t&) { });
    op.run();
    TS_ASSERT_THROWS(op.run(), invalid_argument);
  }

  void test_invalid_construction() {
    log_level_setter quiet(LOG_NONE);
    TS_ASSERT_THROWS((read_operation<int64_t>(nullptr,
                                              [](const int64_t&) { })),
                     invalid_argument);
    TS_ASSERT_THROWS((read_operation<int64_t>(make_source(3), nullptr)),
                     invalid_argument);
  }

  void test_split_before_start_is_rejected() {
    log_level_setter quiet(LOG_NONE);
    read_operation<int64_t> op(make_source(10), [](const int64_t&) { });
    TS_ASSERT(!op.request_dynamic_split(at(5)));
    op.run();
    TS_ASSERT_EQUALS(op.elements_read(), 10);
  }

  void test_split_from_receiver() {
    log_level_setter quiet(LOG_NONE);
    std::vector<int64_t> received;
    read_operation<int64_t>* op_ptr = NULL;
    boost::optional<position> accepted;
    read_operation<int64_t> op(make_source(100), [&](const int64_t& v) {
      received.push_back(v);
      // element 10 has been read and the iterator is now at 11
      if (v == 10) {
        TS_ASSERT(!op_ptr->request_dynamic_split(at(10)));
        TS_ASSERT(!op_ptr->request_dynamic_split(at(11)));
        accepted = op_ptr->request_dynamic_split(at(20));
      }
    });
    op_ptr = &op;
    op.run();
    TS_ASSERT(accepted);
    TS_ASSERT_EQUALS(received.size(), 20);
    TS_ASSERT_EQUALS(received.back(), 19);
    TS_ASSERT_EQUALS(op.elements_read(), 20);
  }

  void test_receiver_exception_propagates() {
    log_level_setter quiet(LOG_NONE);
    size_t count = 0;
    read_operation<int64_t> op(make_source(10), [&](const int64_t& v) {
      ++count;
      if (v == 4) throw std::runtime_error("receiver failed");
    });
    TS_ASSERT_THROWS(op.run(), std::runtime_error);
    TS_ASSERT_EQUALS(count, 5);
  }

  void test_decode_error_propagates() {
    log_level_setter quiet(LOG_NONE);
    auto records = std::make_shared<record_list>();
    records->push_back(std::string("\x01"));
    records->push_back(std::string("\x80"));
    auto src = std::make_shared<in_memory_source<int64_t> >(
        records, boost::none, boost::none,
        std::make_shared<var_int64_coder>());
    std::vector<int64_t> received;
    read_operation<int64_t> op(src, [&](const int64_t& v) {
      received.push_back(v);
    });
    TS_ASSERT_THROWS(op.run(), decode_error);
    TS_ASSERT_EQUALS(received.size(), 1);
    TS_ASSERT_EQUALS(*get_record_index(*op.get_progress()->pos), 1);
  }

  void test_progress_log_interval_is_a_global() {
    log_level_setter quiet(LOG_NONE);
    size_t saved = source_config::SOURCE_PROGRESS_LOG_INTERVAL;
    TS_ASSERT(globals::set_global("SOURCE_PROGRESS_LOG_INTERVAL", int64_t(7))
              == globals::set_global_error_codes::SUCCESS);
    TS_ASSERT_EQUALS(source_config::SOURCE_PROGRESS_LOG_INTERVAL, 7);
    TS_ASSERT(globals::set_global("SOURCE_PROGRESS_LOG_INTERVAL", int64_t(-1))
              == globals::set_global_error_codes::INVALID_VAL);

    read_operation<int64_t> op(make_source(50), [](const int64_t&) { });
    op.run();
    TS_ASSERT_EQUALS(op.elements_read(), 50);
    source_config::SOURCE_PROGRESS_LOG_INTERVAL = saved;
  }

  /**
   * A control thread splits the running read ahead of its position; the
   * receiver sees exactly the records before the accepted stop position.
   */
  void test_concurrent_dynamic_split() {
    log_level_setter quiet(LOG_NONE);
    const size_t n = 50000;
    std::vector<int64_t> received;
    read_operation<int64_t> op(make_source(n), [&](const int64_t& v) {
      received.push_back(v);
    });
    atomic<size_t> done(0);
    std::thread worker([&]() {
      op.run();
      done.inc();
    });

    boost::optional<position> accepted;
    while (done == 0 && !accepted) {
      boost::optional<progress> p = op.get_progress();
      if (!p) continue;
      int64_t index = *get_record_index(*p->pos);
      accepted = op.request_dynamic_split(at(index + 1000));
    }
    worker.join();

    if (accepted) {
      TS_ASSERT_EQUALS(received.size(), (size_t)*get_record_index(*accepted));
    } else {
      TS_ASSERT_EQUALS(received.size(), n);
    }
    for (size_t i = 0; i < received.size(); ++i) {
      TS_ASSERT_EQUALS(received[i], (int64_t)i);
    }
    TS_ASSERT_EQUALS(op.elements_read(), received.size());
  }
};
