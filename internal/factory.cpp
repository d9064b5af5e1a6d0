#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/grpc/monitor_server.hpp"
#include "internal/inventory/static_inventory.hpp"
#include "internal/notify/log_notifier.hpp"
#include "internal/notify/webhook_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/icmp_prober.hpp"
#include "internal/store/result_store.hpp"
#include "internal/tracking/timeout_tracker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if FLEETWATCH_DB_SQLITE
#include "internal/inventory/sqlite/sqlite_inventory.hpp"
#endif
#if FLEETWATCH_DB_POSTGRES
#include "internal/inventory/postgres/pg_inventory.hpp"
#endif

namespace fleetwatch::factory {

using namespace fleetwatch;
using fleetwatch::runtime::config::AlertingConfig;
using fleetwatch::runtime::config::InventoryConfig;
using fleetwatch::runtime::config::RuntimeConfig;

std::shared_ptr<inventory::Inventory> BuildInventory(const InventoryConfig& config) {
  if (config.has_sqlite()) {
#if FLEETWATCH_DB_SQLITE
    return std::make_shared<inventory::sqlite::SqliteInventory>(config.sqlite().path(), config.sqlite().query());
#else
    throw util::InvalidConfig("sqlite inventory requested but not enabled at build time");
#endif
  }

  if (config.has_postgres()) {
#if FLEETWATCH_DB_POSTGRES
    return std::make_shared<inventory::postgres::PgInventory>(config.postgres().connection_uri(), config.postgres().query());
#else
    throw util::InvalidConfig("postgres inventory requested but not enabled at build time");
#endif
  }

  if (config.has_static_list()) {
    std::vector<inventory::InventoryRow> rows;
    rows.reserve(config.static_list().devices_size());
    for (const auto& entry : config.static_list().devices()) {
      inventory::InventoryRow row;
      row.id        = entry.id();
      row.address   = entry.address();
      row.hostname  = entry.hostname();
      row.brand     = entry.brand();
      row.os        = entry.os();
      row.condition = entry.condition().empty() ? "ok" : entry.condition();
      rows.push_back(std::move(row));
    }
    return std::make_shared<inventory::StaticInventory>(std::move(rows));
  }

  throw util::InvalidConfig("no inventory backend configured");
}

std::shared_ptr<notify::Notifier> BuildNotifier(const AlertingConfig& config) {
  if (config.has_webhook()) {
    const auto& webhook = config.webhook();

    notify::WebhookOptions options;
    options.url = webhook.url();
    if (!webhook.recipient_field().empty()) options.recipient_field = webhook.recipient_field();
    if (!webhook.message_field().empty()) options.message_field = webhook.message_field();
    options.static_fields.insert(webhook.static_fields().begin(), webhook.static_fields().end());
    options.headers.insert(webhook.headers().begin(), webhook.headers().end());
    if (webhook.has_timeout()) options.timeout = util::FromProto(webhook.timeout());
    return std::make_shared<notify::WebhookNotifier>(std::move(options));
  }

  auto level = spdlog::level::warn;
  if (config.has_log() && !config.log().level().empty()) {
    level = spdlog::level::from_str(config.log().level());
  }
  return std::make_shared<notify::LogNotifier>(level);
}

Application Build(const RuntimeConfig& config) {
  return Build(config, std::make_shared<probe::IcmpProber>(), BuildInventory(config.inventory()));
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<probe::Prober> prober, std::shared_ptr<inventory::Inventory> inventory) {
  Application app;

  // ------------------------------------------------------------------
  // Probing
  // ------------------------------------------------------------------
  dispatch::DispatchOptions dispatch_options;
  dispatch_options.concurrency_limit = config.polling().max_concurrency();
  dispatch_options.probe_timeout     = util::FromProto(config.polling().probe_timeout());

  auto dispatcher = std::make_shared<dispatch::Dispatcher>(std::move(prober), dispatch_options);

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  const std::filesystem::path output_dir = config.store().output_dir();
  auto                        store      = std::make_shared<store::ResultStore>(output_dir);

  // ------------------------------------------------------------------
  // Timeout tracking and alerting
  // ------------------------------------------------------------------
  const auto& alerting = config.alerting();

  tracking::TrackerOptions tracker_options;
  tracker_options.enabled          = config.tracking().enabled();
  tracker_options.alerting_enabled = alerting.enabled();
  tracker_options.threshold        = alerting.threshold();
  tracker_options.cooldown         = util::FromProto(alerting.cooldown());
  tracker_options.recovery_notice  = alerting.recovery_notice();
  tracker_options.recipients.assign(alerting.recipients().begin(), alerting.recipients().end());
  tracker_options.state_path = output_dir / config.tracking().state_file();

  auto notifier = alerting.enabled() ? BuildNotifier(alerting) : nullptr;
  auto tracker  = std::make_shared<tracking::TimeoutTracker>(std::move(tracker_options), std::move(notifier));

  // ------------------------------------------------------------------
  // Scheduler
  // ------------------------------------------------------------------
  scheduler::SchedulerOptions scheduler_options;
  scheduler_options.interval       = util::FromProto(config.polling().interval());
  scheduler_options.retention_days = config.store().retention_days();

  auto cycle_scheduler = std::make_shared<scheduler::CycleScheduler>(std::move(inventory), dispatcher, store, tracker, scheduler_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.scheduler  = cycle_scheduler;
  app.context.tracker    = tracker;
  app.context.store      = store;
  app.context.dispatcher = dispatcher;

  app.monitor_service = std::make_shared<service::MonitorService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::MonitorServer>(app.monitor_service));

  FLEETWATCH_LOG_INFO("Polling engine built",
                      {observability::IntField("max_concurrency", static_cast<std::int64_t>(dispatch_options.concurrency_limit)),
                       observability::IntField("interval_ms", scheduler_options.interval.count()),
                       observability::IntField("probe_timeout_ms", dispatch_options.probe_timeout.count()),
                       observability::StringField("output_dir", output_dir.string())});
  return app;
}

} // namespace fleetwatch::factory
