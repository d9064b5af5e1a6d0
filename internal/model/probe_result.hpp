#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace fleetwatch::model {

/*
  One probe outcome for one device in one cycle. Append-only.

  latency_ms is set iff success, error_message iff !success.
*/
struct ProbeResult {
  util::TimePoint            timestamp;
  std::string                device_id;
  std::string                address;
  std::string                hostname;
  bool                       success{false};
  std::optional<double>      latency_ms;
  std::optional<std::string> error_message;
};

} // namespace fleetwatch::model
