#include "monitor_server.hpp"

#include "grpc_error.hpp"
#include "fleetwatch/v1.hpp"

namespace fleetwatch::grpc {

using namespace fleetwatch::v1;

MonitorServer::MonitorServer(std::shared_ptr<fleetwatch::service::MonitorService> svc) : service_(std::move(svc)) {
}

::grpc::Status MonitorServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::StartPolling(::grpc::ServerContext*, const StartPollingRequest* req, StartPollingResponse* resp) {
  try {
    *resp = service_->StartPolling(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::StopPolling(::grpc::ServerContext*, const StopPollingRequest* req, StopPollingResponse* resp) {
  try {
    *resp = service_->StopPolling(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::GetTimeoutSummary(::grpc::ServerContext*, const GetTimeoutSummaryRequest* req, GetTimeoutSummaryResponse* resp) {
  try {
    *resp = service_->GetTimeoutSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ListTimeouts(::grpc::ServerContext*, const ListTimeoutsRequest* req, ListTimeoutsResponse* resp) {
  try {
    *resp = service_->ListTimeouts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ListCriticalTimeouts(::grpc::ServerContext*, const ListCriticalTimeoutsRequest* req, ListCriticalTimeoutsResponse* resp) {
  try {
    *resp = service_->ListCriticalTimeouts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ResetTimeouts(::grpc::ServerContext*, const ResetTimeoutsRequest* req, ResetTimeoutsResponse* resp) {
  try {
    *resp = service_->ResetTimeouts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::GetLatestResults(::grpc::ServerContext*, const GetLatestResultsRequest* req, GetLatestResultsResponse* resp) {
  try {
    *resp = service_->GetLatestResults(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::GetDeviceResults(::grpc::ServerContext*, const GetDeviceResultsRequest* req, GetDeviceResultsResponse* resp) {
  try {
    *resp = service_->GetDeviceResults(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ListPartitions(::grpc::ServerContext*, const ListPartitionsRequest* req, ListPartitionsResponse* resp) {
  try {
    *resp = service_->ListPartitions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::RebuildPartition(::grpc::ServerContext*, const RebuildPartitionRequest* req, RebuildPartitionResponse* resp) {
  try {
    *resp = service_->RebuildPartition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::TestProbe(::grpc::ServerContext*, const TestProbeRequest* req, TestProbeResponse* resp) {
  try {
    *resp = service_->TestProbe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fleetwatch::grpc
