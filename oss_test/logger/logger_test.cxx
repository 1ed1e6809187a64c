/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <logger/logger.hpp>
#include <logger/log_level_setter.hpp>
#include <logger/assertions.hpp>
#include <exceptions/error_types.hpp>
#include <cxxtest/TestSuite.h>
using namespace dataflow;

class logger_test: public CxxTest::TestSuite {
 public:
  void test_empty_log() {
    global_logger().set_log_level(LOG_INFO);
    logstream(LOG_INFO) << "\n";
    logstream(LOG_INFO);
    logstream(LOG_INFO);
    logstream(LOG_INFO) << std::endl;
  }

  void test_log_level_setter() {
    global_logger().set_log_level(LOG_INFO);
    logprogress_stream << "This should show up" << std::endl;
    {
      log_level_setter quiet(LOG_NONE);
      TS_ASSERT_EQUALS(global_logger().get_log_level(), LOG_NONE);
      logprogress_stream << "This should not print." << std::endl;
    }
    TS_ASSERT_EQUALS(global_logger().get_log_level(), LOG_INFO);
  }

  void test_filtered_statements_are_not_evaluated() {
    log_level_setter quiet(LOG_WARNING);
    int evaluated = 0;
    logstream(LOG_INFO) << (++evaluated) << std::endl;
    TS_ASSERT_EQUALS(evaluated, 0);
    logstream(LOG_ERROR) << (++evaluated) << std::endl;
    TS_ASSERT_EQUALS(evaluated, 1);
  }

  void test_log_file() {
    std::string fname = "logger_test_output.log";
    global_logger().set_log_level(LOG_INFO);
    TS_ASSERT(global_logger().set_log_file(fname));
    logstream(LOG_INFO) << "line one" << std::endl;
    logstream(LOG_DEBUG) << "filtered line" << std::endl;
    logstream(LOG_WARNING) << "line two";
    TS_ASSERT(global_logger().set_log_file(""));

    std::ifstream fin(fname.c_str());
    std::stringstream contents;
    contents << fin.rdbuf();
    std::string text = contents.str();
    TS_ASSERT(text.find("INFO:") != std::string::npos);
    TS_ASSERT(text.find("line one\n") != std::string::npos);
    TS_ASSERT(text.find("WARNING:") != std::string::npos);
    TS_ASSERT(text.find("line two\n") != std::string::npos);
    TS_ASSERT(text.find("filtered line") == std::string::npos);
    std::remove(fname.c_str());
  }

  void test_log_and_throw() {
    log_level_setter quiet(LOG_NONE);
    TS_ASSERT_THROWS(log_and_throw("plain message"), std::string);
    TS_ASSERT_THROWS(std_log_and_throw(invalid_argument, "bad value " << 3),
                     invalid_argument);
    try {
      std_log_and_throw(decode_error, "record " << 7 << " is broken");
      TS_FAIL("expected an exception");
    } catch (const decode_error& e) {
      TS_ASSERT_EQUALS(std::string(e.what()), "record 7 is broken");
    }
  }

  void test_failed_assertion_throws() {
    log_level_setter quiet(LOG_NONE);
    int value = 3;
    ASSERT_EQ(value, 3);
    TS_ASSERT_THROWS(ASSERT_EQ(value, 4), std::string);
    TS_ASSERT_THROWS(ASSERT_TRUE(value > 5), std::string);
  }
};
