#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "fleetwatch/v1/monitor_service.grpc.pb.h"
#include "internal/service/monitor_service.hpp"

namespace fleetwatch::grpc {

class MonitorServer final : public fleetwatch::v1::MonitorService::Service {
public:
  explicit MonitorServer(std::shared_ptr<fleetwatch::service::MonitorService> svc);

  ::grpc::Status GetStatus(::grpc::ServerContext*,
                     const fleetwatch::v1::GetStatusRequest*,
                     fleetwatch::v1::GetStatusResponse*) override;
  ::grpc::Status StartPolling(::grpc::ServerContext*,
                     const fleetwatch::v1::StartPollingRequest*,
                     fleetwatch::v1::StartPollingResponse*) override;
  ::grpc::Status StopPolling(::grpc::ServerContext*,
                     const fleetwatch::v1::StopPollingRequest*,
                     fleetwatch::v1::StopPollingResponse*) override;
  ::grpc::Status GetTimeoutSummary(::grpc::ServerContext*,
                     const fleetwatch::v1::GetTimeoutSummaryRequest*,
                     fleetwatch::v1::GetTimeoutSummaryResponse*) override;
  ::grpc::Status ListTimeouts(::grpc::ServerContext*,
                     const fleetwatch::v1::ListTimeoutsRequest*,
                     fleetwatch::v1::ListTimeoutsResponse*) override;
  ::grpc::Status ListCriticalTimeouts(::grpc::ServerContext*,
                     const fleetwatch::v1::ListCriticalTimeoutsRequest*,
                     fleetwatch::v1::ListCriticalTimeoutsResponse*) override;
  ::grpc::Status ResetTimeouts(::grpc::ServerContext*,
                     const fleetwatch::v1::ResetTimeoutsRequest*,
                     fleetwatch::v1::ResetTimeoutsResponse*) override;
  ::grpc::Status GetLatestResults(::grpc::ServerContext*,
                     const fleetwatch::v1::GetLatestResultsRequest*,
                     fleetwatch::v1::GetLatestResultsResponse*) override;
  ::grpc::Status GetDeviceResults(::grpc::ServerContext*,
                     const fleetwatch::v1::GetDeviceResultsRequest*,
                     fleetwatch::v1::GetDeviceResultsResponse*) override;
  ::grpc::Status ListPartitions(::grpc::ServerContext*,
                     const fleetwatch::v1::ListPartitionsRequest*,
                     fleetwatch::v1::ListPartitionsResponse*) override;
  ::grpc::Status RebuildPartition(::grpc::ServerContext*,
                     const fleetwatch::v1::RebuildPartitionRequest*,
                     fleetwatch::v1::RebuildPartitionResponse*) override;
  ::grpc::Status TestProbe(::grpc::ServerContext*,
                     const fleetwatch::v1::TestProbeRequest*,
                     fleetwatch::v1::TestProbeResponse*) override;

private:
  std::shared_ptr<fleetwatch::service::MonitorService> service_;
};

}
