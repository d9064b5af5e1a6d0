#include "config_validator.hpp"

#include <array>
#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::config {

using namespace std::chrono_literals;
using fleetwatch::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kMaxConcurrency = 1024;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::InvalidConfig("Invalid configuration: " + message);
  }
}

bool IsPlainFileName(const std::string& name) {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

bool IsKnownLevel(std::string_view level) {
  static constexpr std::array<std::string_view, 9> kLevels = {"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};
  for (auto known : kLevels) {
    if (known == level) return true;
  }
  return false;
}

} // namespace

void ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50061");
  }

  auto* polling = config->mutable_polling();
  if (!polling->has_interval()) {
    *polling->mutable_interval() = util::ToProto(std::chrono::milliseconds(5s));
  }
  if (!polling->has_probe_timeout()) {
    *polling->mutable_probe_timeout() = util::ToProto(std::chrono::milliseconds(3s));
  }
  if (polling->max_concurrency() == 0) {
    polling->set_max_concurrency(20);
  }
  if (!polling->has_autostart()) {
    polling->set_autostart(true);
  }

  auto* store = config->mutable_store();
  if (store->output_dir().empty()) {
    store->set_output_dir("ping_results");
  }
  if (!store->has_retention_days()) {
    store->set_retention_days(30);
  }

  auto* tracking = config->mutable_tracking();
  if (!tracking->has_enabled()) {
    tracking->set_enabled(true);
  }
  if (tracking->state_file().empty()) {
    tracking->set_state_file("timeout_tracking.csv");
  }

  auto* alerting = config->mutable_alerting();
  if (!alerting->has_enabled()) {
    alerting->set_enabled(true);
  }
  if (alerting->threshold() == 0) {
    alerting->set_threshold(5);
  }
  if (!alerting->has_cooldown()) {
    *alerting->mutable_cooldown() = util::ToProto(std::chrono::milliseconds(3600s));
  }
  if (alerting->notifier_case() == fleetwatch::runtime::config::AlertingConfig::NOTIFIER_NOT_SET) {
    alerting->mutable_log();
  }
  if (alerting->has_webhook()) {
    auto* webhook = alerting->mutable_webhook();
    if (webhook->recipient_field().empty()) {
      webhook->set_recipient_field("recipient");
    }
    if (webhook->message_field().empty()) {
      webhook->set_message_field("message");
    }
    if (!webhook->has_timeout()) {
      *webhook->mutable_timeout() = util::ToProto(std::chrono::milliseconds(10s));
    }
  }

  if (config->logging().level().empty()) {
    config->mutable_logging()->set_level("info");
  }
}

void Validate(const RuntimeConfig& config) {
  const auto& polling = config.polling();
  Require(util::FromProto(polling.interval()) > 0ms, "polling.interval must be positive");
  Require(util::FromProto(polling.probe_timeout()) > 0ms, "polling.probe_timeout must be positive");
  Require(polling.max_concurrency() >= 1, "polling.max_concurrency must be at least 1");
  Require(polling.max_concurrency() <= kMaxConcurrency, "polling.max_concurrency must not exceed " + std::to_string(kMaxConcurrency));

  Require(!config.store().output_dir().empty(), "store.output_dir must not be empty");
  Require(IsPlainFileName(config.tracking().state_file()), "tracking.state_file must be a file name without directories");

  const auto& alerting = config.alerting();
  Require(alerting.threshold() >= 1, "alerting.threshold must be at least 1");
  Require(util::FromProto(alerting.cooldown()) >= 0ms, "alerting.cooldown must not be negative");
  if (alerting.has_webhook()) {
    Require(!alerting.webhook().url().empty(), "alerting.webhook.url must not be empty");
    Require(alerting.recipients_size() > 0, "alerting.recipients must list at least one recipient for the webhook notifier");
    Require(util::FromProto(alerting.webhook().timeout()) > 0ms, "alerting.webhook.timeout must be positive");
  }
  if (alerting.has_log() && !alerting.log().level().empty()) {
    Require(IsKnownLevel(alerting.log().level()), "alerting.log.level must be one of trace, debug, info, warn, error, critical or off");
  }

  const auto& inventory = config.inventory();
  switch (inventory.backend_case()) {
    case fleetwatch::runtime::config::InventoryConfig::kSqlite:
      Require(!inventory.sqlite().path().empty(), "inventory.sqlite.path must not be empty");
      break;
    case fleetwatch::runtime::config::InventoryConfig::kPostgres:
      Require(!inventory.postgres().connection_uri().empty(), "inventory.postgres.connection_uri must not be empty");
      break;
    case fleetwatch::runtime::config::InventoryConfig::kStaticList:
      break;
    case fleetwatch::runtime::config::InventoryConfig::BACKEND_NOT_SET:
      Require(false, "inventory must configure one of sqlite, postgres or static_list");
      break;
  }

  Require(IsKnownLevel(config.logging().level()), "logging.level '" + config.logging().level() + "' is not a known level");
}

} // namespace fleetwatch::config
