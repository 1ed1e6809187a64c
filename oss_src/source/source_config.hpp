/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_SOURCE_CONFIG_HPP
#define DATAFLOW_SOURCE_CONFIG_HPP
#include <cstddef>
namespace dataflow {

/**
** Global configuration for sources, keep them as non-constants because we
** want to allow user/server to change the configuration according to the
** environment
**/
namespace source_config {
  /**
  **  The number of elements a read_operation reads between progress log
  **  lines. 0 disables the periodic progress lines.
  **/
  extern size_t SOURCE_PROGRESS_LOG_INTERVAL;
}

}
#endif //DATAFLOW_SOURCE_CONFIG_HPP
