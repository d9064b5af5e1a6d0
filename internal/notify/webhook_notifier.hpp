#pragma once

#include <chrono>
#include <map>
#include <string>

#include "internal/notify/notifier.hpp"

namespace fleetwatch::notify {

struct WebhookOptions {
  std::string                        url;
  std::string                        recipient_field{"recipient"};
  std::string                        message_field{"message"};
  std::map<std::string, std::string> static_fields;
  std::map<std::string, std::string> headers;
  std::chrono::milliseconds          timeout{10000};
};

/*
  POSTs a JSON object to an HTTP endpoint (messaging gateway):

      { <static_fields...>, "<recipient_field>": recipient, "<message_field>": message }

  Any 2xx response counts as delivered.
*/
class WebhookNotifier final : public Notifier {
 public:
  explicit WebhookNotifier(WebhookOptions options);

  bool Send(const std::string& recipient, const std::string& message) override;

  std::string BuildBody(const std::string& recipient, const std::string& message) const;

 private:
  WebhookOptions options_;
};

} // namespace fleetwatch::notify
