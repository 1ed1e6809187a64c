/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */

#ifndef DATAFLOW_TIMER_HPP
#define DATAFLOW_TIMER_HPP

#include <sys/time.h>
#include <stdio.h>

#include <iostream>

namespace dataflow {
  /**
   * \ingroup util
   *
   * \brief A simple class that can be used for benchmarking/timing up
   * to microsecond resolution.
   *
   * The timer is used by calling \ref dataflow::timer::start and then
   * by getting the current time since start by calling
   * \ref dataflow::timer::current_time.
   *
   * \code
   * dataflow::timer ti;
   * ti.start();
   * // do something
   * logstream(LOG_INFO) << "Elapsed time: " << ti.current_time() << std::endl;
   * \endcode
   */
  class timer {
  private:
    /**
     * \brief The internal start time for this timer object
     */
    timeval start_time_;
  public:
    /**
     * \brief The timer starts on construction but can be restarted by
     * calling \ref dataflow::timer::start.
     */
    inline timer() { start(); }

    /**
     * \brief Reset the timer.
     */
    inline void start() { gettimeofday(&start_time_, NULL); }

    /**
     * \brief Returns the elapsed time in seconds since
     * \ref dataflow::timer::start was last called.
     */
    inline double current_time() const {
      timeval current_time;
      gettimeofday(&current_time, NULL);
      double answer =
        (double)(current_time.tv_sec - start_time_.tv_sec) +
        ((double)(current_time.tv_usec - start_time_.tv_usec))/1.0E6;
       return answer;
    } // end of current_time

    /**
     * \brief Returns the elapsed time in milliseconds since
     * \ref dataflow::timer::start was last called.
     */
    inline double current_time_millis() const { return current_time() * 1000; }
  }; // end of Timer

} // end of dataflow namespace

inline std::ostream& operator<<(std::ostream& out, const dataflow::timer& t) {
  return out << t.current_time();
}

#endif
