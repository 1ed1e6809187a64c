/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <source/source.hpp>

namespace dataflow {

const char* split_decision_name(split_decision decision) {
  switch (decision) {
    case split_decision::ACCEPTED:
      return "ACCEPTED";
    case split_decision::UNSUPPORTED_POSITION:
      return "UNSUPPORTED_POSITION";
    case split_decision::NOT_AFTER_CURRENT_POSITION:
      return "NOT_AFTER_CURRENT_POSITION";
    case split_decision::NOT_BEFORE_STOP_POSITION:
      return "NOT_BEFORE_STOP_POSITION";
  }
  return "";
}

} // namespace dataflow
