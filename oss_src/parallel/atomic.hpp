/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_ATOMIC_HPP
#define DATAFLOW_ATOMIC_HPP

#include <stdint.h>
#include <type_traits>

namespace dataflow {

/**
 * \ingroup util
 * \brief atomic object
 * A templated class for creating atomic integral counters. Any number of
 * threads may increment it while others read it.
 */
template <typename T>
class atomic {
  static_assert(std::is_integral<T>::value,
                "dataflow::atomic requires an integral type");
 public:
  //! The current value of the atomic number
  volatile T value;

  //! Creates an atomic number with value "value"
  atomic(const T& value = T()) : value(value) { }

  //! Performs an atomic increment by 1, returning the new value
  T inc() { return __sync_add_and_fetch(&value, 1); }

  //! Performs an atomic decrement by 1, returning the new value
  T dec() { return __sync_sub_and_fetch(&value, 1); }

  //! Performs an atomic increment by 'val', returning the new value
  T inc(const T val) { return __sync_add_and_fetch(&value, val); }

  //! Performs an atomic decrement by 'val', returning the new value
  T dec(const T val) { return __sync_sub_and_fetch(&value, val); }

  //! Reads the current value with a full barrier
  T load() const {
    return __sync_add_and_fetch(const_cast<volatile T*>(&value), 0);
  }

  //! Lvalue implicit cast
  operator T() const { return load(); }

  T operator++() { return inc(); }
  T operator--() { return dec(); }
  T operator+=(const T val) { return inc(val); }
  T operator-=(const T val) { return dec(val); }

  //! Performs an atomic increment by 1, returning the old value
  T inc_ret_last() { return __sync_fetch_and_add(&value, 1); }

  //! Performs an atomic exchange with 'val', returning the previous value
  T exchange(const T val) { return __sync_lock_test_and_set(&value, val); }
};

} // namespace dataflow
#endif
