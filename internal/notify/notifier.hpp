#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fleetwatch::notify {

/*
  Outbound alert channel.

  Send() reports delivery as a bool and must not throw; failures are
  logged by the implementation and never retried here.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual bool Send(const std::string& recipient, const std::string& message) = 0;
};

/*
  Sends message to every recipient (or once with an empty recipient when
  the list is empty). Returns the number of accepted deliveries.
*/
std::size_t Broadcast(Notifier& notifier, const std::vector<std::string>& recipients, const std::string& message);

} // namespace fleetwatch::notify
