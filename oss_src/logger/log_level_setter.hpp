/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */

/**
 * @file log_level_setter.hpp
 * Usage:
 * Create a log_level_setter object to change the loglevel as desired.
 * Upon destruction of the object, the loglevel will be reset to the
 * previous logging level.
 *
 * log_level_setter quiet(LOG_NONE); // quiets the logging that follows
 */

#ifndef DATAFLOW_LOG_LEVEL_SETTER_HPP
#define DATAFLOW_LOG_LEVEL_SETTER_HPP

#include <logger/logger.hpp>

namespace dataflow {

/**
 * Sets the global log level for the lifetime of the object.
 */
class log_level_setter {
 private:
  int prev_level;

  log_level_setter(const log_level_setter&);
  log_level_setter& operator=(const log_level_setter&);
 public:

  /**
   * Set global log level to the provided log level.
   * \param loglevel desired loglevel. See logger.hpp for a description of
   * each level.
   */
  explicit log_level_setter(int loglevel);

  /**
   * Destructor resets global log level to the previous level.
   */
  ~log_level_setter();
};

} // namespace dataflow

#endif
