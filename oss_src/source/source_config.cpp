/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <cstddef>
#include <globals/globals.hpp>
#include <source/source_config.hpp>

namespace dataflow {

namespace source_config {
size_t SOURCE_PROGRESS_LOG_INTERVAL = 100000;

REGISTER_GLOBAL_WITH_CHECKS(int64_t,
                            SOURCE_PROGRESS_LOG_INTERVAL,
                            true,
                            +[](int64_t val){ return val >= 0; });
}
}
