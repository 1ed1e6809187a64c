/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_PTHREAD_TOOLS_HPP
#define DATAFLOW_PTHREAD_TOOLS_HPP

#include <pthread.h>
#include <cstdlib>

namespace dataflow {

/**
 * \ingroup util
 *
 * Simple wrapper around pthread's mutex. Satisfies the standard Lockable
 * requirements, so it can be used with std::lock_guard and
 * std::unique_lock.
 *
 * Copying a mutex produces a new, unlocked mutex: objects that embed a
 * mutex stay copyable, but the lock state is never shared.
 */
class mutex {
 public:
  // mutable so const methods of the owning object can lock
  mutable pthread_mutex_t m_mut;

  mutex() {
    int error = pthread_mutex_init(&m_mut, NULL);
    if (error) abort();
  }

  mutex(const mutex&) {
    int error = pthread_mutex_init(&m_mut, NULL);
    if (error) abort();
  }

  ~mutex() {
    pthread_mutex_destroy(&m_mut);
  }

  // not copyable
  void operator=(const mutex&) { }

  /// Acquires a lock on the mutex
  inline void lock() const {
    int error = pthread_mutex_lock(&m_mut);
    if (error) abort();
  }

  /// Releases a lock on the mutex
  inline void unlock() const {
    pthread_mutex_unlock(&m_mut);
  }

  /// Non-blocking attempt to acquire a lock on the mutex
  inline bool try_lock() const {
    return pthread_mutex_trylock(&m_mut) == 0;
  }
};

} // namespace dataflow

#endif
