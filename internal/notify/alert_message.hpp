#pragma once

#include <string>
#include <string_view>

#include "internal/model/timeout_record.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::notify {

enum class AlertKind {
  kTimeout,
  kRecovery,
};

std::string_view ToString(AlertKind kind);

/*
  Emitted by the timeout tracker. For kRecovery the record is the last
  failing state before the successful probe.
*/
struct AlertEvent {
  AlertKind            kind{AlertKind::kTimeout};
  model::TimeoutRecord record;
  util::TimePoint      at;
};

std::string FormatAlert(const AlertEvent& event);

} // namespace fleetwatch::notify
