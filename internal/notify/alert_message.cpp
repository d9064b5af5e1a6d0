#include "alert_message.hpp"

#include <sstream>

namespace fleetwatch::notify {

namespace {

std::string OrDash(const std::string& value) {
  return value.empty() ? "-" : value;
}

} // namespace

std::string_view ToString(AlertKind kind) {
  switch (kind) {
    case AlertKind::kTimeout:
      return "timeout";
    case AlertKind::kRecovery:
      return "recovery";
  }
  return "timeout";
}

std::string FormatAlert(const AlertEvent& event) {
  const auto&        record = event.record;
  std::ostringstream out;

  if (event.kind == AlertKind::kTimeout) {
    out << "[ALERT] Device not responding\n"
        << "IP: " << record.address << "\n"
        << "Hostname: " << OrDash(record.hostname) << "\n"
        << "Device ID: " << OrDash(record.device_id) << "\n"
        << "Brand/Model: " << OrDash(record.brand) << "\n"
        << "OS: " << OrDash(record.os) << "\n"
        << "Condition: " << model::ToString(record.condition) << "\n"
        << "Consecutive timeouts: " << record.consecutive_timeouts << "\n"
        << "First timeout: " << util::FormatLocal(record.first_timeout) << "\n"
        << "Last timeout: " << util::FormatLocal(record.last_timeout) << "\n"
        << "Notified at: " << util::FormatLocal(event.at);
    return out.str();
  }

  out << "[RECOVERED] Device responding again\n"
      << "IP: " << record.address << "\n"
      << "Hostname: " << OrDash(record.hostname) << "\n"
      << "Device ID: " << OrDash(record.device_id) << "\n"
      << "Brand/Model: " << OrDash(record.brand) << "\n"
      << "Timeouts before recovery: " << record.consecutive_timeouts << "\n"
      << "Down since: " << util::FormatLocal(record.first_timeout) << "\n"
      << "Recovered at: " << util::FormatLocal(event.at);
  return out.str();
}

} // namespace fleetwatch::notify
