/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_GLOBALS_GLOBALS_HPP
#define DATAFLOW_GLOBALS_GLOBALS_HPP
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace dataflow {
namespace globals {

/**
 * The value of a registered global as seen through the registry.
 * size_t globals are exposed as int64_t.
 */
typedef boost::variant<int64_t, double, std::string> global_value_type;

enum class set_global_error_codes {
  SUCCESS = 0,
  NO_NAME = 1,
  NOT_RUNTIME_MODIFIABLE = 2,
  INVALID_VAL = 3
};

/**
 * Registers a global variable with the registry at static initialization
 * time. Use through REGISTER_GLOBAL / REGISTER_GLOBAL_WITH_CHECKS rather
 * than directly.
 *
 * The check function, if provided, is called with every proposed new value
 * (from set_global() or the environment); the value is only stored if the
 * check returns true.
 */
struct register_global_helper {
  register_global_helper(const char* name, int64_t* value,
                         bool runtime_modifiable,
                         std::function<bool(int64_t)> check = nullptr);
  register_global_helper(const char* name, size_t* value,
                         bool runtime_modifiable,
                         std::function<bool(int64_t)> check = nullptr);
  register_global_helper(const char* name, double* value,
                         bool runtime_modifiable,
                         std::function<bool(double)> check = nullptr);
  register_global_helper(const char* name, std::string* value,
                         bool runtime_modifiable,
                         std::function<bool(std::string)> check = nullptr);
};

/**
 * Returns the current value of the global with the given name, or none if
 * no such global is registered.
 */
boost::optional<global_value_type> get_global(const std::string& name);

/**
 * Sets the global with the given name. Integers are accepted for double
 * globals; doubles are not accepted for integer globals, and negative values
 * are not accepted for size_t globals.
 */
set_global_error_codes set_global(const std::string& name,
                                  global_value_type value);

/**
 * Lists all globals (name, value). If runtime_modifiable is true, only the
 * globals which may be changed at runtime are listed; otherwise only those
 * which may not.
 */
std::vector<std::pair<std::string, global_value_type> >
list_globals(bool runtime_modifiable);

/**
 * For every registered global NAME, if the environment variable
 * DATAFLOW_NAME is set, parses it and assigns it to the global, regardless
 * of runtime modifiability. Values which fail to parse or fail the global's
 * check are logged and ignored.
 */
void initialize_globals_from_environment();

/// Printable name of an error code.
const char* set_global_error_name(set_global_error_codes code);

} // namespace globals
} // namespace dataflow

/**
 * \code
 * size_t SOURCE_PROGRESS_LOG_INTERVAL = 100000;
 * REGISTER_GLOBAL(int64_t, SOURCE_PROGRESS_LOG_INTERVAL, true);
 * \endcode
 */
#define REGISTER_GLOBAL(type, name, runtime_modifiable)                     \
  static ::dataflow::globals::register_global_helper                        \
      register_global_##name##_(#name, &name, runtime_modifiable);

#define REGISTER_GLOBAL_WITH_CHECKS(type, name, runtime_modifiable, lambda) \
  static ::dataflow::globals::register_global_helper                        \
      register_global_##name##_(#name, &name, runtime_modifiable,           \
                                std::function<bool(type)>(lambda));

#endif
