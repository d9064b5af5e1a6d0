#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/inventory/inventory.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/probe/prober.hpp"
#include "internal/scheduler/cycle_scheduler.hpp"
#include "internal/service/monitor_service.hpp"
#include "internal/service/service_context.hpp"

namespace fleetwatch::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                         context;
  std::shared_ptr<service::MonitorService>        monitor_service;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

/*
  Build

  Constructs the entire polling engine based on runtime config. The
  scheduler is built stopped; the caller decides when to Start() it.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete inventory, notifier and
  prober types. Tests pass their own prober and inventory.
*/
Application Build(const fleetwatch::runtime::config::RuntimeConfig& config);
Application Build(const fleetwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<probe::Prober> prober,
                  std::shared_ptr<inventory::Inventory> inventory);

std::shared_ptr<inventory::Inventory> BuildInventory(const fleetwatch::runtime::config::InventoryConfig& config);
std::shared_ptr<notify::Notifier>     BuildNotifier(const fleetwatch::runtime::config::AlertingConfig& config);

}
