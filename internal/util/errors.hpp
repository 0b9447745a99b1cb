#pragma once

#include <stdexcept>
#include <string>

namespace codestaff::util {

/*
  Central error types.

  SchemaError is fatal at startup, StoreError is fatal to the coordinator.
  Neither is retried.
*/

class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace codestaff::util
