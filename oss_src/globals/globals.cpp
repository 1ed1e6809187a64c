/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#include <cstdlib>
#include <map>
#include <mutex>
#include <boost/lexical_cast.hpp>
#include <parallel/pthread_tools.hpp>
#include <logger/logger.hpp>
#include <globals/globals.hpp>

namespace dataflow {
namespace globals {

namespace {

struct global_entry {
  boost::variant<int64_t*, size_t*, double*, std::string*> value;
  bool runtime_modifiable = false;
  std::function<bool(int64_t)> int_check;
  std::function<bool(double)> double_check;
  std::function<bool(std::string)> string_check;
};

struct global_registry {
  mutex lock;
  std::map<std::string, global_entry> entries;
};

// function-local so it exists before any static registration runs
global_registry& get_registry() {
  static global_registry registry;
  return registry;
}

void add_entry(const char* name, global_entry entry) {
  global_registry& registry = get_registry();
  std::lock_guard<mutex> guard(registry.lock);
  registry.entries[name] = entry;
}

global_value_type read_entry(const global_entry& entry) {
  switch (entry.value.which()) {
    case 0: return *boost::get<int64_t*>(entry.value);
    case 1: return (int64_t)(*boost::get<size_t*>(entry.value));
    case 2: return *boost::get<double*>(entry.value);
    default: return *boost::get<std::string*>(entry.value);
  }
}

/*
 * Assigns the value to the entry if the types are compatible and the check
 * passes. Caller holds the registry lock.
 */
bool write_entry(global_entry& entry, const global_value_type& value) {
  switch (entry.value.which()) {
    case 0:
    case 1: {
      const int64_t* intval = boost::get<int64_t>(&value);
      if (intval == NULL) return false;
      if (entry.int_check && !entry.int_check(*intval)) return false;
      if (entry.value.which() == 0) {
        *boost::get<int64_t*>(entry.value) = *intval;
      } else {
        if (*intval < 0) return false;
        *boost::get<size_t*>(entry.value) = (size_t)(*intval);
      }
      return true;
    }
    case 2: {
      double dblval;
      if (const int64_t* intval = boost::get<int64_t>(&value)) {
        dblval = (double)(*intval);
      } else if (const double* d = boost::get<double>(&value)) {
        dblval = *d;
      } else {
        return false;
      }
      if (entry.double_check && !entry.double_check(dblval)) return false;
      *boost::get<double*>(entry.value) = dblval;
      return true;
    }
    default: {
      const std::string* strval = boost::get<std::string>(&value);
      if (strval == NULL) return false;
      if (entry.string_check && !entry.string_check(*strval)) return false;
      *boost::get<std::string*>(entry.value) = *strval;
      return true;
    }
  }
}

/*
 * Parses an environment string into the representation the entry expects.
 * Returns none if the string does not parse.
 */
boost::optional<global_value_type> parse_for_entry(const global_entry& entry,
                                                   const std::string& str) {
  try {
    switch (entry.value.which()) {
      case 0:
      case 1:
        return global_value_type(boost::lexical_cast<int64_t>(str));
      case 2:
        return global_value_type(boost::lexical_cast<double>(str));
      default:
        return global_value_type(str);
    }
  } catch (const boost::bad_lexical_cast&) {
    return boost::none;
  }
}

} // anonymous namespace

register_global_helper::register_global_helper(
    const char* name, int64_t* value, bool runtime_modifiable,
    std::function<bool(int64_t)> check) {
  global_entry entry;
  entry.value = value;
  entry.runtime_modifiable = runtime_modifiable;
  entry.int_check = check;
  add_entry(name, entry);
}

register_global_helper::register_global_helper(
    const char* name, size_t* value, bool runtime_modifiable,
    std::function<bool(int64_t)> check) {
  global_entry entry;
  entry.value = value;
  entry.runtime_modifiable = runtime_modifiable;
  entry.int_check = check;
  add_entry(name, entry);
}

register_global_helper::register_global_helper(
    const char* name, double* value, bool runtime_modifiable,
    std::function<bool(double)> check) {
  global_entry entry;
  entry.value = value;
  entry.runtime_modifiable = runtime_modifiable;
  entry.double_check = check;
  add_entry(name, entry);
}

register_global_helper::register_global_helper(
    const char* name, std::string* value, bool runtime_modifiable,
    std::function<bool(std::string)> check) {
  global_entry entry;
  entry.value = value;
  entry.runtime_modifiable = runtime_modifiable;
  entry.string_check = check;
  add_entry(name, entry);
}

boost::optional<global_value_type> get_global(const std::string& name) {
  global_registry& registry = get_registry();
  std::lock_guard<mutex> guard(registry.lock);
  auto iter = registry.entries.find(name);
  if (iter == registry.entries.end()) return boost::none;
  return read_entry(iter->second);
}

set_global_error_codes set_global(const std::string& name,
                                  global_value_type value) {
  global_registry& registry = get_registry();
  std::lock_guard<mutex> guard(registry.lock);
  auto iter = registry.entries.find(name);
  if (iter == registry.entries.end()) {
    return set_global_error_codes::NO_NAME;
  }
  if (!iter->second.runtime_modifiable) {
    return set_global_error_codes::NOT_RUNTIME_MODIFIABLE;
  }
  if (!write_entry(iter->second, value)) {
    return set_global_error_codes::INVALID_VAL;
  }
  logstream(LOG_INFO) << "Set global " << name << " to " << value << std::endl;
  return set_global_error_codes::SUCCESS;
}

std::vector<std::pair<std::string, global_value_type> >
list_globals(bool runtime_modifiable) {
  std::vector<std::pair<std::string, global_value_type> > ret;
  global_registry& registry = get_registry();
  std::lock_guard<mutex> guard(registry.lock);
  for (const auto& kv : registry.entries) {
    if (kv.second.runtime_modifiable == runtime_modifiable) {
      ret.push_back({kv.first, read_entry(kv.second)});
    }
  }
  return ret;
}

void initialize_globals_from_environment() {
  global_registry& registry = get_registry();
  std::lock_guard<mutex> guard(registry.lock);
  for (auto& kv : registry.entries) {
    std::string envname = "DATAFLOW_" + kv.first;
    const char* envval = std::getenv(envname.c_str());
    if (envval == NULL) continue;

    boost::optional<global_value_type> parsed =
        parse_for_entry(kv.second, envval);
    if (!parsed || !write_entry(kv.second, *parsed)) {
      logstream(LOG_WARNING) << "Ignoring invalid value \"" << envval
                             << "\" for environment variable " << envname
                             << std::endl;
      continue;
    }
    logstream(LOG_INFO) << "Setting configuration variable " << kv.first
                        << " to " << envval << std::endl;
  }
}

const char* set_global_error_name(set_global_error_codes code) {
  switch (code) {
    case set_global_error_codes::SUCCESS: return "SUCCESS";
    case set_global_error_codes::NO_NAME: return "NO_NAME";
    case set_global_error_codes::NOT_RUNTIME_MODIFIABLE:
      return "NOT_RUNTIME_MODIFIABLE";
    case set_global_error_codes::INVALID_VAL: return "INVALID_VAL";
  }
  return "";
}

} // namespace globals
} // namespace dataflow
