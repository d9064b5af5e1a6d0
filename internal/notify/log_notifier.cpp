#include "log_notifier.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace fleetwatch::notify {

using fleetwatch::observability::StringField;

LogNotifier::LogNotifier(spdlog::level::level_enum level) : level_(level) {
}

bool LogNotifier::Send(const std::string& recipient, const std::string& message) {
  std::string single_line = message;
  std::replace(single_line.begin(), single_line.end(), '\n', ';');
  fleetwatch::observability::Log(level_, "Alert notification",
                                 {StringField("recipient", recipient.empty() ? "log" : recipient), StringField("message", single_line)});
  return true;
}

} // namespace fleetwatch::notify
