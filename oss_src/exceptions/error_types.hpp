/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */

#ifndef DATAFLOW_EXCEPTIONS_ERROR_TYPES_HPP
#define DATAFLOW_EXCEPTIONS_ERROR_TYPES_HPP
#include <string>
#include <stdexcept>

namespace dataflow {

/**
 * Malformed construction parameters or arguments, e.g. a negative start
 * index or an end index before the start index. Subclasses
 * std::invalid_argument.
 */
class invalid_argument : public std::invalid_argument {
 public:
  explicit invalid_argument(const std::string& msg)
      : std::invalid_argument(msg) { }
};

/**
 * Raised by source_iterator::next() when the iterator is exhausted.
 * Subclasses std::out_of_range.
 */
class no_such_element : public std::out_of_range {
 public:
  explicit no_such_element(const std::string& msg)
      : std::out_of_range(msg) { }
};

/**
 * Raised by a coder which cannot decode its input.
 */
class decode_error : public std::runtime_error {
 public:
  explicit decode_error(const std::string& msg)
      : std::runtime_error(msg) { }
};

} // namespace dataflow
#endif
