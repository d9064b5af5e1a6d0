#pragma once

#include <spdlog/common.h>

#include "internal/notify/notifier.hpp"

namespace fleetwatch::notify {

// Writes alerts to the service log. Always succeeds.
class LogNotifier final : public Notifier {
 public:
  explicit LogNotifier(spdlog::level::level_enum level = spdlog::level::warn);

  bool Send(const std::string& recipient, const std::string& message) override;

 private:
  spdlog::level::level_enum level_;
};

} // namespace fleetwatch::notify
