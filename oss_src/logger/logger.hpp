/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */

/**
 * @file logger.hpp
 * Usage:
 * First include logger.hpp. To logger, use the logstream() macro:
 * \code
 * logstream(LOG_INFO) << "Opened source over " << n << " records" << std::endl;
 * \endcode
 *
 * Every logstream() statement emits exactly one line, prefixed with the
 * level tag, the source file, line number and enclosing function.
 * Statements below the current log level are not evaluated at all.
 *
 * To report an error, use log_and_throw() or std_log_and_throw(), which
 * emit the message at LOG_ERROR and then throw.
 */

#ifndef DATAFLOW_LOG_LOG_HPP
#define DATAFLOW_LOG_LOG_HPP

#include <string>
#include <sstream>
#include <iostream>
#include <fstream>
#include <parallel/pthread_tools.hpp>
#include <logger/fail_method.hpp>

/**
 * \def LOG_FATAL
 *   Used for fatal and probably irrecoverable conditions
 * \def LOG_ERROR
 *   Used for errors which are recoverable within the scope of the function
 * \def LOG_WARNING
 *   Logs interesting conditions which are probably not fatal
 * \def LOG_PROGRESS
 *   Used for user-facing progress messages
 * \def LOG_EMPH
 *   Outputs as LOG_INFO, but highlighted on the console
 * \def LOG_INFO
 *   Used for providing general useful information
 * \def LOG_DEBUG
 *   Debugging purposes only
 * \def LOG_EVERYTHING
 *   Log everything
 */
#define LOG_NONE 8
#define LOG_FATAL 7
#define LOG_ERROR 6
#define LOG_WARNING 5
#define LOG_PROGRESS 4
#define LOG_EMPH 3
#define LOG_INFO 2
#define LOG_DEBUG 1
#define LOG_EVERYTHING 0

namespace dataflow {

/**
 * The process-wide logger. Writes to a log file (if one is set) and to
 * std::cerr (if console output is enabled). Safe for concurrent use; each
 * line is written atomically with respect to other lines.
 */
class file_logger {
 public:
  file_logger();
  ~file_logger();

  /// Sets the minimum level a message must have to be emitted.
  void set_log_level(int new_log_level);

  int get_log_level() const { return log_level; }

  /**
   * Directs output to the given file, truncating it. An empty file name
   * closes the current log file. Returns false if the file cannot be opened.
   */
  bool set_log_file(std::string file);

  std::string get_log_file() const { return log_file; }

  void set_log_to_console(bool consolelog) { log_to_console = consolelog; }

  bool get_log_to_console() const { return log_to_console; }

  /// Emits a fully formatted line at the given level.
  void write_line(int lineloglevel, const std::string& line);

 private:
  mutex lock;
  std::ofstream fout;
  std::string log_file;
  volatile int log_level;
  volatile bool log_to_console;
};

/// Returns the global logger instance.
file_logger& global_logger();

/// Returns the printable name of a log level ("INFO", "WARNING", ...).
const char* log_level_name(int lineloglevel);

/**
 * One line of log output. Accumulates everything streamed into it and
 * hands the finished line to the global logger on destruction.
 */
class log_line {
 public:
  log_line(int lineloglevel, const char* file, const char* function, int line);
  ~log_line();

  std::ostream& stream() { return buffer; }

 private:
  int level;
  std::ostringstream buffer;

  log_line(const log_line&);
  log_line& operator=(const log_line&);
};

} // namespace dataflow

#define logstream(lvl)                                                      \
  if ((lvl) < ::dataflow::global_logger().get_log_level()) ;                \
  else ::dataflow::log_line(lvl, __FILE__, __func__, __LINE__).stream()

#define logprogress_stream logstream(LOG_PROGRESS)

#define logger(lvl, msg)                                                    \
  do { logstream(lvl) << msg << std::endl; } while (0)

/**
 * Logs the message at LOG_ERROR and throws it as a std::string.
 */
#define log_and_throw(message)                                              \
  do {                                                                      \
    std::string _dataflow_msg_(message);                                    \
    logstream(LOG_ERROR) << _dataflow_msg_ << std::endl;                    \
    throw(_dataflow_msg_);                                                  \
  } while (0)

/**
 * Logs the message at LOG_ERROR and throws an exception of the given type,
 * constructed from the message. The message may use stream syntax:
 * \code
 * std_log_and_throw(invalid_argument, "bad index " << index);
 * \endcode
 */
#define std_log_and_throw(exception_type, message)                          \
  do {                                                                      \
    std::ostringstream _dataflow_ss_;                                       \
    _dataflow_ss_ << message;                                               \
    logstream(LOG_ERROR) << _dataflow_ss_.str() << std::endl;               \
    throw exception_type(_dataflow_ss_.str());                              \
  } while (0)

#endif // DATAFLOW_LOG_LOG_HPP
