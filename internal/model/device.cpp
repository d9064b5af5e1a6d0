#include "device.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>

namespace fleetwatch::model {

namespace {

std::string Lower(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

} // namespace

std::optional<Condition> ParseCondition(std::string_view value) {
  const auto lowered = Lower(value);
  if (lowered == "ok" || lowered == "baik") {
    return Condition::kOk;
  }
  if (lowered == "maintenance") {
    return Condition::kMaintenance;
  }
  if (lowered == "missing" || lowered == "hilang") {
    return Condition::kMissing;
  }
  return std::nullopt;
}

std::string_view ToString(Condition condition) {
  switch (condition) {
    case Condition::kOk:
      return "ok";
    case Condition::kMaintenance:
      return "maintenance";
    case Condition::kMissing:
      return "missing";
  }
  return "ok";
}

bool IsValidAddress(std::string_view address) {
  if (address.empty() || address.size() > 15) {
    return false;
  }
  const std::string copy(address);
  in_addr           parsed{};
  return ::inet_pton(AF_INET, copy.c_str(), &parsed) == 1;
}

bool IsPollable(const Device& device) {
  return device.condition != Condition::kMissing && IsValidAddress(device.address);
}

std::string DisplayName(const Device& device) {
  return device.hostname.empty() ? device.address : device.hostname;
}

} // namespace fleetwatch::model
