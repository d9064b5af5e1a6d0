#include "internal/notify/alert_message.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/notify/log_notifier.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/notify/webhook_notifier.hpp"

namespace {

using namespace std::chrono_literals;
using fleetwatch::notify::AlertEvent;
using fleetwatch::notify::AlertKind;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

class CountingNotifier final : public fleetwatch::notify::Notifier {
 public:
  bool Send(const std::string& recipient, const std::string&) override {
    recipients.push_back(recipient);
    return recipient != "reject";
  }

  std::vector<std::string> recipients;
};

fleetwatch::model::TimeoutRecord MakeRecord() {
  const auto t0 = *fleetwatch::util::ParseLocal("2024-05-01T09:00:00.000");

  fleetwatch::model::TimeoutRecord record;
  record.address              = "10.0.0.5";
  record.hostname             = "lab-pc-05";
  record.device_id            = "17";
  record.brand                = "Dell Optiplex";
  record.os                   = "Windows 11";
  record.condition            = fleetwatch::model::Condition::kMaintenance;
  record.consecutive_timeouts = 7;
  record.first_timeout        = t0;
  record.last_timeout         = t0 + 30s;
  record.last_updated         = t0 + 30s;
  return record;
}

void TestTimeoutAlertCarriesDeviceContext() {
  AlertEvent event{AlertKind::kTimeout, MakeRecord(), *fleetwatch::util::ParseLocal("2024-05-01T09:00:31.000")};

  const auto text = fleetwatch::notify::FormatAlert(event);
  assert(text.rfind("[ALERT]", 0) == 0);
  assert(Contains(text, "IP: 10.0.0.5"));
  assert(Contains(text, "Hostname: lab-pc-05"));
  assert(Contains(text, "Device ID: 17"));
  assert(Contains(text, "Brand/Model: Dell Optiplex"));
  assert(Contains(text, "OS: Windows 11"));
  assert(Contains(text, "Condition: maintenance"));
  assert(Contains(text, "Consecutive timeouts: 7"));
  assert(Contains(text, "First timeout: 2024-05-01T09:00:00.000"));
  assert(Contains(text, "Last timeout: 2024-05-01T09:00:30.000"));
  assert(Contains(text, "Notified at: 2024-05-01T09:00:31.000"));
}

void TestMissingContextUsesDash() {
  auto record     = MakeRecord();
  record.hostname = "";
  record.brand    = "";
  record.os       = "";

  const auto text = fleetwatch::notify::FormatAlert(AlertEvent{AlertKind::kTimeout, record, record.last_timeout});
  assert(Contains(text, "Hostname: -\n"));
  assert(Contains(text, "Brand/Model: -\n"));
  assert(Contains(text, "OS: -\n"));
}

void TestRecoveryMessage() {
  const auto record = MakeRecord();
  const auto text   = fleetwatch::notify::FormatAlert(AlertEvent{AlertKind::kRecovery, record, record.last_timeout + 5s});
  assert(text.rfind("[RECOVERED]", 0) == 0);
  assert(Contains(text, "Timeouts before recovery: 7"));
  assert(Contains(text, "Recovered at: 2024-05-01T09:00:35.000"));
  assert(fleetwatch::notify::ToString(AlertKind::kRecovery) == "recovery");
}

void TestBroadcastCountsAcceptedDeliveries() {
  CountingNotifier notifier;
  assert(fleetwatch::notify::Broadcast(notifier, {"a", "reject", "b"}, "hello") == 2);
  assert(notifier.recipients.size() == 3);

  CountingNotifier single;
  assert(fleetwatch::notify::Broadcast(single, {}, "hello") == 1);
  assert(single.recipients.size() == 1);
  assert(single.recipients[0].empty());
}

void TestLogNotifierAlwaysDelivers() {
  fleetwatch::notify::LogNotifier notifier(spdlog::level::info);
  assert(notifier.Send("6281100000000", "[ALERT] test"));
  assert(notifier.Send("", "[ALERT] test"));
}

void TestWebhookBodyLayout() {
  fleetwatch::notify::WebhookOptions options;
  options.url             = "http://gateway.local/api/send_message";
  options.recipient_field = "phone_no";
  options.message_field   = "message";
  options.static_fields   = {{"api_key", "secret"}, {"device_key", "wa-1"}};
  fleetwatch::notify::WebhookNotifier notifier(options);

  const auto json = notifier.BuildBody("6281100000000", "line one\nline \"two\"");

  google::protobuf::Struct parsed;
  const auto               status = google::protobuf::util::JsonStringToMessage(json, &parsed);
  assert(status.ok());
  const auto& fields = parsed.fields();
  assert(fields.size() == 4);
  assert(fields.at("phone_no").string_value() == "6281100000000");
  assert(fields.at("message").string_value() == "line one\nline \"two\"");
  assert(fields.at("api_key").string_value() == "secret");
  assert(fields.at("device_key").string_value() == "wa-1");
}

void TestWebhookFailureIsReportedNotThrown() {
  fleetwatch::notify::WebhookOptions options;
  // nothing listens on port 1
  options.url     = "http://127.0.0.1:1/send";
  options.timeout = 500ms;
  fleetwatch::notify::WebhookNotifier notifier(options);

  assert(!notifier.Send("6281100000000", "[ALERT] test"));
}

} // namespace

int main() {
  TestTimeoutAlertCarriesDeviceContext();
  TestMissingContextUsesDash();
  TestRecoveryMessage();
  TestBroadcastCountsAcceptedDeliveries();
  TestLogNotifierAlwaysDelivers();
  TestWebhookBodyLayout();
  TestWebhookFailureIsReportedNotThrown();

  std::cout << "fleetwatch_unit_alert_message: pass\n";
  return 0;
}
