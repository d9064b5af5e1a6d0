#pragma once

#include "fleetwatch/v1.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/model/device.hpp"
#include "internal/model/probe_result.hpp"
#include "internal/scheduler/cycle_scheduler.hpp"
#include "internal/store/result_store.hpp"
#include "internal/tracking/timeout_tracker.hpp"

namespace fleetwatch::service {

/*
  Model → wire conversions used by MonitorService.
*/

fleetwatch::v1::DeviceCondition ToProto(model::Condition condition);
fleetwatch::v1::SchedulerState  ToProto(scheduler::SchedulerState state);

fleetwatch::v1::ProbeResult     ToProto(const model::ProbeResult& result);
fleetwatch::v1::TimeoutRecord   ToProto(const tracking::TimeoutEntry& entry);
fleetwatch::v1::TimeoutSummary  ToProto(const tracking::TimeoutSummary& summary);
fleetwatch::v1::PartitionInfo   ToProto(const store::PartitionInfo& partition);
fleetwatch::v1::CycleReport     ToProto(const scheduler::CycleReport& report);
fleetwatch::v1::SchedulerStatus ToProto(const scheduler::SchedulerStatus& status, const dispatch::DispatchOptions& dispatch);

} // namespace fleetwatch::service
