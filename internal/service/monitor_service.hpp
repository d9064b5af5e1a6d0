#pragma once

#include <cstdint>
#include <string>

#include "fleetwatch/v1.hpp"
#include "service_context.hpp"

namespace fleetwatch::service {

/*
  Query and control surface over the polling engine. Every method is
  synchronous and safe to call while cycles run; failures are thrown as
  util errors and mapped to status codes by the gRPC adapter.
*/
class MonitorService {
public:
  static constexpr uint32_t kDefaultLatestLimit = 100;
  static constexpr uint32_t kMaxLatestLimit     = 10000;
  static constexpr uint32_t kDefaultDeviceHours = 24;

  explicit MonitorService(ServiceContext ctx);

  fleetwatch::v1::GetStatusResponse GetStatus(const fleetwatch::v1::GetStatusRequest& req);
  fleetwatch::v1::StartPollingResponse StartPolling(const fleetwatch::v1::StartPollingRequest& req);
  fleetwatch::v1::StopPollingResponse StopPolling(const fleetwatch::v1::StopPollingRequest& req);

  fleetwatch::v1::GetTimeoutSummaryResponse GetTimeoutSummary(const fleetwatch::v1::GetTimeoutSummaryRequest& req);
  fleetwatch::v1::ListTimeoutsResponse ListTimeouts(const fleetwatch::v1::ListTimeoutsRequest& req);
  fleetwatch::v1::ListCriticalTimeoutsResponse ListCriticalTimeouts(const fleetwatch::v1::ListCriticalTimeoutsRequest& req);
  fleetwatch::v1::ResetTimeoutsResponse ResetTimeouts(const fleetwatch::v1::ResetTimeoutsRequest& req);

  fleetwatch::v1::GetLatestResultsResponse GetLatestResults(const fleetwatch::v1::GetLatestResultsRequest& req);
  fleetwatch::v1::GetDeviceResultsResponse GetDeviceResults(const fleetwatch::v1::GetDeviceResultsRequest& req);
  fleetwatch::v1::ListPartitionsResponse ListPartitions(const fleetwatch::v1::ListPartitionsRequest& req);
  fleetwatch::v1::RebuildPartitionResponse RebuildPartition(const fleetwatch::v1::RebuildPartitionRequest& req);

  fleetwatch::v1::TestProbeResponse TestProbe(const fleetwatch::v1::TestProbeRequest& req);

private:
  fleetwatch::v1::SchedulerStatus CurrentSchedulerStatus() const;

  ServiceContext ctx_;
};

}
