/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */

/**
 * @file assertions.hpp
 * Invariant checks. ASSERT_* are always evaluated; DASSERT_* only in
 * debug builds (when NDEBUG is not defined). A failed check logs the
 * condition at LOG_FATAL with both operand values and then invokes
 * DATAFLOW_LOGGER_FAIL_METHOD.
 *
 * These are for conditions that can only fail through a programming
 * error inside this codebase. Bad caller input is reported with
 * std_log_and_throw() instead.
 */
#ifndef DATAFLOW_LOGGER_ASSERTIONS_HPP
#define DATAFLOW_LOGGER_ASSERTIONS_HPP

#include <logger/logger.hpp>
#include <logger/fail_method.hpp>

#define DATAFLOW_CHECK_OP_(a, b, op)                                        \
  do {                                                                      \
    if (!((a) op (b))) {                                                    \
      std::ostringstream _dataflow_assert_ss_;                              \
      _dataflow_assert_ss_ << "Check failed: " << #a << " " << #op << " "   \
                           << #b << " [" << (a) << " " << #op << " "        \
                           << (b) << "]";                                   \
      logstream(LOG_FATAL) << _dataflow_assert_ss_.str() << std::endl;      \
      DATAFLOW_LOGGER_FAIL_METHOD(_dataflow_assert_ss_.str());              \
    }                                                                       \
  } while (0)

#define ASSERT_MSG(cond, msg)                                               \
  do {                                                                      \
    if (!(cond)) {                                                          \
      std::ostringstream _dataflow_assert_ss_;                              \
      _dataflow_assert_ss_ << "Check failed: " << #cond << ": " << msg;     \
      logstream(LOG_FATAL) << _dataflow_assert_ss_.str() << std::endl;      \
      DATAFLOW_LOGGER_FAIL_METHOD(_dataflow_assert_ss_.str());              \
    }                                                                       \
  } while (0)

#define ASSERT_TRUE(cond) ASSERT_MSG(cond, "expected true")
#define ASSERT_FALSE(cond) ASSERT_MSG(!(cond), "expected false")
#define ASSERT_EQ(a, b) DATAFLOW_CHECK_OP_(a, b, ==)
#define ASSERT_NE(a, b) DATAFLOW_CHECK_OP_(a, b, !=)
#define ASSERT_LT(a, b) DATAFLOW_CHECK_OP_(a, b, <)
#define ASSERT_LE(a, b) DATAFLOW_CHECK_OP_(a, b, <=)
#define ASSERT_GT(a, b) DATAFLOW_CHECK_OP_(a, b, >)
#define ASSERT_GE(a, b) DATAFLOW_CHECK_OP_(a, b, >=)

#ifdef NDEBUG
#define DASSERT_TRUE(cond) do { } while (0)
#define DASSERT_FALSE(cond) do { } while (0)
#define DASSERT_EQ(a, b) do { } while (0)
#define DASSERT_NE(a, b) do { } while (0)
#define DASSERT_LT(a, b) do { } while (0)
#define DASSERT_LE(a, b) do { } while (0)
#define DASSERT_GT(a, b) do { } while (0)
#define DASSERT_GE(a, b) do { } while (0)
#define DASSERT_MSG(cond, msg) do { } while (0)
#else
#define DASSERT_TRUE(cond) ASSERT_TRUE(cond)
#define DASSERT_FALSE(cond) ASSERT_FALSE(cond)
#define DASSERT_EQ(a, b) ASSERT_EQ(a, b)
#define DASSERT_NE(a, b) ASSERT_NE(a, b)
#define DASSERT_LT(a, b) ASSERT_LT(a, b)
#define DASSERT_LE(a, b) ASSERT_LE(a, b)
#define DASSERT_GT(a, b) ASSERT_GT(a, b)
#define DASSERT_GE(a, b) ASSERT_GE(a, b)
#define DASSERT_MSG(cond, msg) ASSERT_MSG(cond, msg)
#endif

#endif
