#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fleetwatch/v1.hpp"
#include "internal/config/config_validator.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/monitor_server.hpp"
#include "internal/inventory/static_inventory.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleetwatch::runtime::config::RuntimeConfig;

// Everything answers except 10.0.0.2.
class FakeProber final : public fleetwatch::probe::Prober {
 public:
  fleetwatch::probe::ProbeOutcome Probe(const std::string& address, std::chrono::milliseconds) override {
    if (address == "10.0.0.2") {
      return fleetwatch::probe::ProbeOutcome::Failed(fleetwatch::probe::kReasonTimeout);
    }
    return fleetwatch::probe::ProbeOutcome::Reachable(0.8);
  }
};

RuntimeConfig MakeConfig(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fleetwatch_grpc_status_tests" / name;
  std::filesystem::remove_all(dir);

  RuntimeConfig config;
  config.mutable_store()->set_output_dir(dir.string());
  config.mutable_inventory()->mutable_static_list();
  fleetwatch::config::ApplyDefaults(&config);
  return config;
}

fleetwatch::factory::Application MakeApp(const std::string& name) {
  std::vector<fleetwatch::inventory::InventoryRow> rows = {
      {"1", "10.0.0.1", "pc-1", "", "", "ok"},
      {"2", "10.0.0.2", "pc-2", "", "", "ok"},
  };
  return fleetwatch::factory::Build(MakeConfig(name), std::make_shared<FakeProber>(),
                                    std::make_shared<fleetwatch::inventory::StaticInventory>(rows));
}

void TestGetStatusReportsStoppedScheduler() {
  auto                            app = MakeApp("status");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::GetStatusRequest  req;
  fleetwatch::v1::GetStatusResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = server.GetStatus(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.scheduler().state() == fleetwatch::v1::SCHEDULER_STATE_STOPPED);
  assert(resp.scheduler().max_concurrency() == 20);
  assert(resp.tracking_enabled());
  assert(resp.timeouts().alert_threshold() == 5);
}

void TestProbeRejectsBadAddress() {
  auto                            app = MakeApp("probe_address");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::TestProbeRequest  req;
  fleetwatch::v1::TestProbeResponse resp;
  ::grpc::ServerContext             grpc_ctx;
  req.set_address("10.0.0.256");

  const auto status = server.TestProbe(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestProbeReturnsResult() {
  auto                            app = MakeApp("probe_ok");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::TestProbeRequest  req;
  fleetwatch::v1::TestProbeResponse resp;
  ::grpc::ServerContext             grpc_ctx;
  req.set_address("10.0.0.2");

  const auto status = server.TestProbe(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.result().success());
  assert(resp.result().error_message() == "timeout");
  // ad-hoc probes are not recorded
  assert(app.context.store->ListPartitions().empty());
}

void TestRebuildMissingPartitionIsNotFound() {
  auto                            app = MakeApp("rebuild_missing");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::RebuildPartitionRequest  req;
  fleetwatch::v1::RebuildPartitionResponse resp;
  ::grpc::ServerContext                    grpc_ctx;
  req.set_date("20200101");

  const auto status = server.RebuildPartition(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRebuildBadDateIsInvalidArgument() {
  auto                            app = MakeApp("rebuild_bad_date");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::RebuildPartitionRequest  req;
  fleetwatch::v1::RebuildPartitionResponse resp;
  ::grpc::ServerContext                    grpc_ctx;
  req.set_date("2020-01-01");

  const auto status = server.RebuildPartition(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestDeviceResultsRequireId() {
  auto                            app = MakeApp("device_results");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::GetDeviceResultsRequest  req;
  fleetwatch::v1::GetDeviceResultsResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.GetDeviceResults(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestStartStopReportTransitions() {
  auto                            app = MakeApp("start_stop");
  fleetwatch::grpc::MonitorServer server(app.monitor_service);

  fleetwatch::v1::StopPollingRequest  stop_req;
  fleetwatch::v1::StopPollingResponse stop_resp;
  ::grpc::ServerContext               ctx1;
  assert(server.StopPolling(&ctx1, &stop_req, &stop_resp).ok());
  assert(stop_resp.already_stopped());

  fleetwatch::v1::StartPollingRequest  start_req;
  fleetwatch::v1::StartPollingResponse start_resp;
  ::grpc::ServerContext                ctx2;
  assert(server.StartPolling(&ctx2, &start_req, &start_resp).ok());
  assert(!start_resp.already_running());

  ::grpc::ServerContext ctx3;
  assert(server.StartPolling(&ctx3, &start_req, &start_resp).ok());
  assert(start_resp.already_running());

  ::grpc::ServerContext ctx4;
  assert(server.StopPolling(&ctx4, &stop_req, &stop_resp).ok());
  assert(!stop_resp.already_stopped());
  assert(stop_resp.scheduler().state() == fleetwatch::v1::SCHEDULER_STATE_STOPPED);
}

void TestErrorMapping() {
  assert(fleetwatch::grpc::ToStatus(fleetwatch::util::StoreError("disk full")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(fleetwatch::grpc::ToStatus(fleetwatch::util::InventoryError("db locked")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(fleetwatch::grpc::ToStatus(fleetwatch::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(fleetwatch::grpc::ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(fleetwatch::grpc::ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestGetStatusReportsStoppedScheduler();
  TestProbeRejectsBadAddress();
  TestProbeReturnsResult();
  TestRebuildMissingPartitionIsNotFound();
  TestRebuildBadDateIsInvalidArgument();
  TestDeviceResultsRequireId();
  TestStartStopReportTransitions();
  TestErrorMapping();

  std::cout << "fleetwatch_unit_grpc_status: pass\n";
  return 0;
}
