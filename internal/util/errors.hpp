#pragma once

#include <stdexcept>
#include <string>

namespace fleetwatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised while loading or validating RuntimeConfig. Fatal at startup.
class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Result store / state file I/O failure.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Device inventory backend unreachable or returned garbage.
class InventoryError : public std::runtime_error {
 public:
  explicit InventoryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleetwatch::util
