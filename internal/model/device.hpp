#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fleetwatch::model {

enum class Condition {
  kOk,
  kMaintenance,
  kMissing,
};

/*
  Accepts the canonical names (ok, maintenance, missing) as well as the
  spellings used by the asset inventory database (baik, hilang).
  Case-insensitive.
*/
std::optional<Condition> ParseCondition(std::string_view value);
std::string_view         ToString(Condition condition);

/*
  Immutable snapshot of one inventory entry, fetched once per cycle.
*/
struct Device {
  std::string id;
  std::string address;
  std::string hostname;
  std::string brand;
  std::string os;
  Condition   condition{Condition::kOk};
};

// Dotted-quad IPv4 literal.
bool IsValidAddress(std::string_view address);

// Not missing and has a usable address.
bool IsPollable(const Device& device);

// Hostname shown in results; falls back to the address.
std::string DisplayName(const Device& device);

} // namespace fleetwatch::model
