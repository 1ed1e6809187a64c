/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <cstring>
#include <mutex>
#include <logger/logger.hpp>

namespace dataflow {

file_logger::file_logger()
    : log_level(LOG_INFO), log_to_console(true) { }

file_logger::~file_logger() {
  if (fout.is_open()) {
    fout.flush();
    fout.close();
  }
}

void file_logger::set_log_level(int new_log_level) {
  if (new_log_level < LOG_EVERYTHING) new_log_level = LOG_EVERYTHING;
  if (new_log_level > LOG_NONE) new_log_level = LOG_NONE;
  log_level = new_log_level;
}

bool file_logger::set_log_file(std::string file) {
  std::lock_guard<mutex> guard(lock);
  if (fout.is_open()) {
    fout.flush();
    fout.close();
  }
  log_file = file;
  if (file.empty()) return true;
  fout.open(file.c_str());
  return fout.good();
}

void file_logger::write_line(int lineloglevel, const std::string& line) {
  std::lock_guard<mutex> guard(lock);
  if (fout.is_open()) {
    fout << line;
    fout.flush();
  }
  if (log_to_console) {
    if (lineloglevel == LOG_EMPH) {
      std::cerr << "\033[32m" << line << "\033[0m";
    } else if (lineloglevel >= LOG_ERROR) {
      std::cerr << "\033[1;31m" << line << "\033[0m";
    } else {
      std::cerr << line;
    }
    std::cerr.flush();
  }
}

file_logger& global_logger() {
  static file_logger l;
  return l;
}

const char* log_level_name(int lineloglevel) {
  switch (lineloglevel) {
    case LOG_EVERYTHING: return "EVERYTHING";
    case LOG_DEBUG:      return "DEBUG";
    case LOG_INFO:       return "INFO";
    case LOG_EMPH:       return "INFO";
    case LOG_PROGRESS:   return "PROGRESS";
    case LOG_WARNING:    return "WARNING";
    case LOG_ERROR:      return "ERROR";
    case LOG_FATAL:      return "FATAL";
    default:             return "";
  }
}

log_line::log_line(int lineloglevel, const char* file,
                   const char* function, int line)
    : level(lineloglevel) {
  // progress messages are for users; keep them clean
  if (level == LOG_PROGRESS) return;
  const char* basename = std::strrchr(file, '/');
  basename = (basename == NULL) ? file : basename + 1;
  buffer << log_level_name(level) << ":     "
         << basename << "(" << function << ":" << line << "): ";
}

log_line::~log_line() {
  std::string line = buffer.str();
  if (line.empty() || line[line.length() - 1] != '\n') line += '\n';
  global_logger().write_line(level, line);
}

} // namespace dataflow
