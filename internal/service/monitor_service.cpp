#include "monitor_service.hpp"

#include <algorithm>
#include <chrono>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/model/device.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/cycle_scheduler.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/store/result_store.hpp"
#include "internal/tracking/timeout_tracker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::service {

using namespace fleetwatch::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  fleetwatch::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    fleetwatch::observability::Metrics::Instance().RecordRequest(route, true);
    fleetwatch::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FLEETWATCH_LOG_ERROR("RPC failed",
                         {fleetwatch::observability::StringField("route", route), fleetwatch::observability::StringField("error", ex.what())});
    fleetwatch::observability::Metrics::Instance().RecordRequest(route, false);
    fleetwatch::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

MonitorService::MonitorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

fleetwatch::v1::SchedulerStatus MonitorService::CurrentSchedulerStatus() const {
  return ToProto(ctx_.scheduler->Status(), ctx_.dispatcher->options());
}

GetStatusResponse MonitorService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("MonitorService.GetStatus", [&] {
    GetStatusResponse resp;
    *resp.mutable_scheduler() = CurrentSchedulerStatus();
    *resp.mutable_timeouts()  = ToProto(ctx_.tracker->Summary());
    resp.set_tracking_enabled(ctx_.tracker->options().enabled);
    resp.set_alerting_enabled(ctx_.tracker->options().alerting_enabled);
    resp.set_output_dir(ctx_.store->output_dir().string());
    return resp;
  });
}

StartPollingResponse MonitorService::StartPolling(const StartPollingRequest&) {
  return ObserveRpc("MonitorService.StartPolling", [&] {
    StartPollingResponse resp;
    resp.set_already_running(!ctx_.scheduler->Start());
    *resp.mutable_scheduler() = CurrentSchedulerStatus();
    return resp;
  });
}

StopPollingResponse MonitorService::StopPolling(const StopPollingRequest&) {
  return ObserveRpc("MonitorService.StopPolling", [&] {
    StopPollingResponse resp;
    resp.set_already_stopped(!ctx_.scheduler->Stop());
    *resp.mutable_scheduler() = CurrentSchedulerStatus();
    return resp;
  });
}

GetTimeoutSummaryResponse MonitorService::GetTimeoutSummary(const GetTimeoutSummaryRequest&) {
  return ObserveRpc("MonitorService.GetTimeoutSummary", [&] {
    GetTimeoutSummaryResponse resp;
    *resp.mutable_summary() = ToProto(ctx_.tracker->Summary());
    return resp;
  });
}

ListTimeoutsResponse MonitorService::ListTimeouts(const ListTimeoutsRequest& req) {
  return ObserveRpc("MonitorService.ListTimeouts", [&] {
    ListTimeoutsResponse resp;
    for (const auto& entry : ctx_.tracker->List(std::max<uint32_t>(req.min_consecutive(), 1))) {
      *resp.add_records() = ToProto(entry);
    }
    return resp;
  });
}

ListCriticalTimeoutsResponse MonitorService::ListCriticalTimeouts(const ListCriticalTimeoutsRequest& req) {
  return ObserveRpc("MonitorService.ListCriticalTimeouts", [&] {
    const uint32_t threshold = req.threshold() == 0 ? ctx_.tracker->options().threshold : req.threshold();

    ListCriticalTimeoutsResponse resp;
    resp.set_threshold(threshold);
    for (const auto& entry : ctx_.tracker->Critical(threshold)) {
      *resp.add_records() = ToProto(entry);
    }
    return resp;
  });
}

ResetTimeoutsResponse MonitorService::ResetTimeouts(const ResetTimeoutsRequest&) {
  return ObserveRpc("MonitorService.ResetTimeouts", [&] {
    ResetTimeoutsResponse resp;
    resp.set_cleared(static_cast<uint32_t>(ctx_.tracker->Reset()));
    return resp;
  });
}

GetLatestResultsResponse MonitorService::GetLatestResults(const GetLatestResultsRequest& req) {
  return ObserveRpc("MonitorService.GetLatestResults", [&] {
    const uint32_t limit = req.limit() == 0 ? kDefaultLatestLimit : std::min(req.limit(), kMaxLatestLimit);

    GetLatestResultsResponse resp;
    for (const auto& result : ctx_.store->Latest(limit)) {
      *resp.add_results() = ToProto(result);
    }
    return resp;
  });
}

GetDeviceResultsResponse MonitorService::GetDeviceResults(const GetDeviceResultsRequest& req) {
  return ObserveRpc("MonitorService.GetDeviceResults", [&] {
    if (req.device_id().empty()) {
      throw util::InvalidArgument("device_id is required");
    }
    const uint32_t hours = req.hours() == 0 ? kDefaultDeviceHours : req.hours();
    const auto     since = util::Now() - std::chrono::hours(hours);

    GetDeviceResultsResponse resp;
    for (const auto& result : ctx_.store->ForDevice(req.device_id(), since)) {
      *resp.add_results() = ToProto(result);
    }
    return resp;
  });
}

ListPartitionsResponse MonitorService::ListPartitions(const ListPartitionsRequest&) {
  return ObserveRpc("MonitorService.ListPartitions", [&] {
    ListPartitionsResponse resp;
    for (const auto& partition : ctx_.store->ListPartitions()) {
      *resp.add_partitions() = ToProto(partition);
    }
    return resp;
  });
}

RebuildPartitionResponse MonitorService::RebuildPartition(const RebuildPartitionRequest& req) {
  return ObserveRpc("MonitorService.RebuildPartition", [&] {
    const auto report = ctx_.store->Rebuild(req.date());

    RebuildPartitionResponse resp;
    resp.set_kept(report.kept);
    resp.set_dropped(report.dropped);
    *resp.mutable_partition() = ToProto(report.partition);
    return resp;
  });
}

TestProbeResponse MonitorService::TestProbe(const TestProbeRequest& req) {
  return ObserveRpc("MonitorService.TestProbe", [&] {
    if (!model::IsValidAddress(req.address())) {
      throw util::InvalidArgument("address must be an IPv4 literal: " + req.address());
    }

    std::chrono::milliseconds timeout{0};
    if (req.has_timeout()) {
      timeout = util::FromProto(req.timeout());
      if (timeout.count() < 0) {
        throw util::InvalidArgument("timeout must not be negative");
      }
    }

    model::Device device;
    device.address = req.address();

    TestProbeResponse resp;
    *resp.mutable_result() = ToProto(ctx_.dispatcher->ProbeOne(device, timeout));
    return resp;
  });
}

} // namespace fleetwatch::service
