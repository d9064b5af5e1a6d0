#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/device.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::model {

/*
  Failure streak of one address. Exists only while the streak is >= 1;
  a successful probe deletes it.
*/
struct TimeoutRecord {
  std::string     address;
  std::string     hostname;
  std::string     device_id;
  std::string     brand;
  std::string     os;
  Condition       condition{Condition::kOk};
  uint32_t        consecutive_timeouts{0};
  util::TimePoint first_timeout;
  util::TimePoint last_timeout;
  util::TimePoint last_updated;
};

struct AlertState {
  std::optional<util::TimePoint> last_alert_sent_at;
  uint32_t                       alert_count{0};
};

} // namespace fleetwatch::model
