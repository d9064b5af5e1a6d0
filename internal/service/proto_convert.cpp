#include "proto_convert.hpp"

#include "internal/util/time.hpp"

namespace fleetwatch::service {

using namespace fleetwatch::v1;

DeviceCondition ToProto(model::Condition condition) {
  switch (condition) {
    case model::Condition::kOk:
      return DEVICE_CONDITION_OK;
    case model::Condition::kMaintenance:
      return DEVICE_CONDITION_MAINTENANCE;
    case model::Condition::kMissing:
      return DEVICE_CONDITION_MISSING;
  }
  return DEVICE_CONDITION_UNSPECIFIED;
}

SchedulerState ToProto(scheduler::SchedulerState state) {
  switch (state) {
    case scheduler::SchedulerState::kIdle:
      return SCHEDULER_STATE_IDLE;
    case scheduler::SchedulerState::kRunning:
      return SCHEDULER_STATE_RUNNING;
    case scheduler::SchedulerState::kStopped:
      return SCHEDULER_STATE_STOPPED;
  }
  return SCHEDULER_STATE_UNSPECIFIED;
}

ProbeResult ToProto(const model::ProbeResult& result) {
  ProbeResult out;
  *out.mutable_timestamp() = util::ToProto(result.timestamp);
  out.set_device_id(result.device_id);
  out.set_address(result.address);
  out.set_hostname(result.hostname);
  out.set_success(result.success);
  if (result.latency_ms) out.set_latency_ms(*result.latency_ms);
  if (result.error_message) out.set_error_message(*result.error_message);
  return out;
}

TimeoutRecord ToProto(const tracking::TimeoutEntry& entry) {
  const auto& record = entry.record;

  TimeoutRecord out;
  out.set_address(record.address);
  out.set_hostname(record.hostname);
  out.set_device_id(record.device_id);
  out.set_brand(record.brand);
  out.set_os(record.os);
  out.set_condition(ToProto(record.condition));
  out.set_consecutive_timeouts(record.consecutive_timeouts);
  *out.mutable_first_timeout() = util::ToProto(record.first_timeout);
  *out.mutable_last_timeout()  = util::ToProto(record.last_timeout);
  *out.mutable_last_updated()  = util::ToProto(record.last_updated);
  out.set_alert_count(entry.alert.alert_count);
  if (entry.alert.last_alert_sent_at) {
    *out.mutable_last_alert_sent_at() = util::ToProto(*entry.alert.last_alert_sent_at);
  }
  return out;
}

TimeoutSummary ToProto(const tracking::TimeoutSummary& summary) {
  TimeoutSummary out;
  out.set_total_timeout_devices(static_cast<uint32_t>(summary.total_timeout_devices));
  out.set_max_consecutive_timeouts(summary.max_consecutive_timeouts);
  out.set_average_consecutive_timeouts(summary.average_consecutive_timeouts);
  out.set_devices_with_high_timeouts(static_cast<uint32_t>(summary.devices_with_high_timeouts));
  out.set_critical_devices(static_cast<uint32_t>(summary.critical_devices));
  out.set_alert_threshold(summary.alert_threshold);
  return out;
}

PartitionInfo ToProto(const store::PartitionInfo& partition) {
  PartitionInfo out;
  out.set_file_name(partition.file_name);
  out.set_date(partition.day);
  out.set_size_bytes(partition.size_bytes);
  out.set_record_count(partition.record_count);
  *out.mutable_last_modified() = util::ToProto(partition.last_modified);
  return out;
}

CycleReport ToProto(const scheduler::CycleReport& report) {
  CycleReport out;
  out.set_cycle_id(report.cycle_id);
  *out.mutable_started_at()  = util::ToProto(report.started_at);
  *out.mutable_finished_at() = util::ToProto(report.finished_at);
  out.set_device_count(static_cast<uint32_t>(report.device_count));
  out.set_success_count(static_cast<uint32_t>(report.success_count));
  out.set_failure_count(static_cast<uint32_t>(report.failure_count));
  out.set_success_rate(report.success_rate);
  if (report.avg_latency_ms) out.set_avg_latency_ms(*report.avg_latency_ms);
  if (report.min_latency_ms) out.set_min_latency_ms(*report.min_latency_ms);
  if (report.max_latency_ms) out.set_max_latency_ms(*report.max_latency_ms);
  out.set_inventory_ok(report.inventory_ok);
  out.set_store_ok(report.store_ok);
  out.set_tracker_ok(report.tracker_ok);
  out.set_error(report.error);
  return out;
}

SchedulerStatus ToProto(const scheduler::SchedulerStatus& status, const dispatch::DispatchOptions& dispatch) {
  SchedulerStatus out;
  out.set_state(ToProto(status.state));
  out.set_cycles_completed(status.cycles_completed);
  out.set_ticks_skipped(status.ticks_skipped);
  out.set_inventory_failures(status.inventory_failures);
  *out.mutable_interval()      = util::ToProto(status.options.interval);
  *out.mutable_probe_timeout() = util::ToProto(dispatch.probe_timeout);
  out.set_max_concurrency(static_cast<uint32_t>(dispatch.concurrency_limit));
  if (status.last_cycle) {
    *out.mutable_last_cycle() = ToProto(*status.last_cycle);
  }
  return out;
}

} // namespace fleetwatch::service
