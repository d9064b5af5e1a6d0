#pragma once

#include <memory>

namespace fleetwatch::scheduler { class CycleScheduler; }
namespace fleetwatch::tracking { class TimeoutTracker; }
namespace fleetwatch::store { class ResultStore; }
namespace fleetwatch::dispatch { class Dispatcher; }

namespace fleetwatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fleetwatch::scheduler::CycleScheduler> scheduler;
  std::shared_ptr<fleetwatch::tracking::TimeoutTracker> tracker;
  std::shared_ptr<fleetwatch::store::ResultStore> store;
  std::shared_ptr<fleetwatch::dispatch::Dispatcher> dispatcher;
};

}
