/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */

#ifndef DATAFLOW_LOGGER_FAIL_METHOD_HPP
#define DATAFLOW_LOGGER_FAIL_METHOD_HPP
#include <cstdlib>
#include <string>

/**
 * What a failed ASSERT_* does. Aborts by default; test builds define
 * DATAFLOW_LOGGER_THROW_ON_FAILURE so that a failed assertion surfaces as
 * an exception the test harness can report.
 */
#ifdef DATAFLOW_LOGGER_THROW_ON_FAILURE
#define DATAFLOW_LOGGER_FAIL_METHOD(str) throw(std::string(str))
#else
#define DATAFLOW_LOGGER_FAIL_METHOD(str) abort()
#endif

#endif
