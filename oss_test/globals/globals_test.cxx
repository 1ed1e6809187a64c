/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <cstdlib>
#include <string>
#include <globals/globals.hpp>
#include <logger/log_level_setter.hpp>
#include <cxxtest/TestSuite.h>

using namespace dataflow;
using namespace dataflow::globals;

namespace globals_test_vars {
int64_t TEST_GLOBAL_INT = 10;
size_t TEST_GLOBAL_SIZE = 20;
double TEST_GLOBAL_DOUBLE = 0.5;
std::string TEST_GLOBAL_STRING = "hello";
int64_t TEST_GLOBAL_CONSTANT = 99;

REGISTER_GLOBAL(int64_t, TEST_GLOBAL_INT, true);
REGISTER_GLOBAL_WITH_CHECKS(int64_t, TEST_GLOBAL_SIZE, true,
                            +[](int64_t val) { return val >= 1; });
REGISTER_GLOBAL(double, TEST_GLOBAL_DOUBLE, true);
REGISTER_GLOBAL(std::string, TEST_GLOBAL_STRING, true);
REGISTER_GLOBAL(int64_t, TEST_GLOBAL_CONSTANT, false);
}

using namespace globals_test_vars;

class globals_test: public CxxTest::TestSuite {
 public:
  void test_get_global() {
    auto val = get_global("TEST_GLOBAL_INT");
    TS_ASSERT(val);
    TS_ASSERT_EQUALS(boost::get<int64_t>(*val), TEST_GLOBAL_INT);
    val = get_global("TEST_GLOBAL_SIZE");
    TS_ASSERT(val);
    TS_ASSERT_EQUALS(boost::get<int64_t>(*val), (int64_t)TEST_GLOBAL_SIZE);
    val = get_global("TEST_GLOBAL_STRING");
    TS_ASSERT(val);
    TS_ASSERT_EQUALS(boost::get<std::string>(*val), TEST_GLOBAL_STRING);
    TS_ASSERT(!get_global("NO_SUCH_GLOBAL"));
  }

  void test_set_global() {
    log_level_setter quiet(LOG_NONE);
    TS_ASSERT(set_global("TEST_GLOBAL_INT", int64_t(11)) ==
              set_global_error_codes::SUCCESS);
    TS_ASSERT_EQUALS(TEST_GLOBAL_INT, 11);

    TS_ASSERT(set_global("TEST_GLOBAL_DOUBLE", int64_t(2)) ==
              set_global_error_codes::SUCCESS);
    TS_ASSERT_EQUALS(TEST_GLOBAL_DOUBLE, 2.0);
    TS_ASSERT(set_global("TEST_GLOBAL_DOUBLE", 0.25) ==
              set_global_error_codes::SUCCESS);
    TS_ASSERT_EQUALS(TEST_GLOBAL_DOUBLE, 0.25);

    TS_ASSERT(set_global("TEST_GLOBAL_STRING", std::string("world")) ==
              set_global_error_codes::SUCCESS);
    TS_ASSERT_EQUALS(TEST_GLOBAL_STRING, "world");
  }

  void test_set_global_errors() {
    log_level_setter quiet(LOG_NONE);
    TS_ASSERT(set_global("NO_SUCH_GLOBAL", int64_t(1)) ==
              set_global_error_codes::NO_NAME);
    TS_ASSERT(set_global("TEST_GLOBAL_CONSTANT", int64_t(1)) ==
              set_global_error_codes::NOT_RUNTIME_MODIFIABLE);
    TS_ASSERT_EQUALS(TEST_GLOBAL_CONSTANT, 99);

    // fails the check
    TS_ASSERT(set_global("TEST_GLOBAL_SIZE", int64_t(0)) ==
              set_global_error_codes::INVALID_VAL);
    TS_ASSERT_EQUALS(TEST_GLOBAL_SIZE, 20);
    // wrong type
    TS_ASSERT(set_global("TEST_GLOBAL_INT", 1.5) ==
              set_global_error_codes::INVALID_VAL);
    TS_ASSERT(set_global("TEST_GLOBAL_STRING", int64_t(1)) ==
              set_global_error_codes::INVALID_VAL);
    TS_ASSERT_EQUALS(std::string(set_global_error_name(
                         set_global_error_codes::INVALID_VAL)),
                     "INVALID_VAL");
  }

  void test_list_globals() {
    auto modifiable = list_globals(true);
    auto constant = list_globals(false);
    bool found_int = false, found_constant = false;
    for (const auto& kv : modifiable) {
      if (kv.first == "TEST_GLOBAL_INT") found_int = true;
      TS_ASSERT_DIFFERS(kv.first, "TEST_GLOBAL_CONSTANT");
    }
    for (const auto& kv : constant) {
      if (kv.first == "TEST_GLOBAL_CONSTANT") found_constant = true;
    }
    TS_ASSERT(found_int);
    TS_ASSERT(found_constant);
  }

  void test_initialize_from_environment() {
    log_level_setter quiet(LOG_NONE);
    setenv("DATAFLOW_TEST_GLOBAL_CONSTANT", "123", 1);
    setenv("DATAFLOW_TEST_GLOBAL_SIZE", "not a number", 1);
    setenv("DATAFLOW_TEST_GLOBAL_DOUBLE", "4.5", 1);
    initialize_globals_from_environment();
    // the environment may set globals which are not runtime modifiable
    TS_ASSERT_EQUALS(TEST_GLOBAL_CONSTANT, 123);
    TS_ASSERT_EQUALS(TEST_GLOBAL_SIZE, 20);
    TS_ASSERT_EQUALS(TEST_GLOBAL_DOUBLE, 4.5);
    unsetenv("DATAFLOW_TEST_GLOBAL_CONSTANT");
    unsetenv("DATAFLOW_TEST_GLOBAL_SIZE");
    unsetenv("DATAFLOW_TEST_GLOBAL_DOUBLE");
  }
};
