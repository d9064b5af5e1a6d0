#include "notifier.hpp"

namespace fleetwatch::notify {

std::size_t Broadcast(Notifier& notifier, const std::vector<std::string>& recipients, const std::string& message) {
  if (recipients.empty()) {
    return notifier.Send("", message) ? 1 : 0;
  }

  std::size_t delivered = 0;
  for (const auto& recipient : recipients) {
    if (notifier.Send(recipient, message)) ++delivered;
  }
  return delivered;
}

} // namespace fleetwatch::notify
