#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "fleetwatch/v1.hpp"

using namespace fleetwatch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl <addr> status\n"
            << "  fleetctl <addr> start\n"
            << "  fleetctl <addr> stop\n"
            << "  fleetctl <addr> summary\n"
            << "  fleetctl <addr> timeouts [min_consecutive]\n"
            << "  fleetctl <addr> critical [threshold]\n"
            << "  fleetctl <addr> reset\n"
            << "  fleetctl <addr> latest [limit]\n"
            << "  fleetctl <addr> device <device_id> [hours]\n"
            << "  fleetctl <addr> partitions\n"
            << "  fleetctl <addr> rebuild <YYYYMMDD>\n"
            << "  fleetctl <addr> probe <ipv4> [timeout_ms]\n";
}

static std::optional<uint32_t> ParseCount(const char* value) {
  char*               end    = nullptr;
  const unsigned long parsed = std::strtoul(value, &end, 10);
  if (end == value || *end != '\0' || parsed > UINT32_MAX) return std::nullopt;
  return static_cast<uint32_t>(parsed);
}

static std::string FormatTime(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() == 0 && ts.nanos() == 0) return "-";
  const std::time_t seconds = static_cast<std::time_t>(ts.seconds());
  std::tm           local{};
  localtime_r(&seconds, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

static const char* StateName(SchedulerState state) {
  switch (state) {
    case SCHEDULER_STATE_IDLE:
      return "idle";
    case SCHEDULER_STATE_RUNNING:
      return "running";
    case SCHEDULER_STATE_STOPPED:
      return "stopped";
    default:
      return "unknown";
  }
}

static void PrintScheduler(const SchedulerStatus& s) {
  std::cout << "state=" << StateName(s.state()) << "\n";
  std::cout << "cycles=" << s.cycles_completed() << "\n";
  std::cout << "ticks_skipped=" << s.ticks_skipped() << "\n";
  std::cout << "inventory_failures=" << s.inventory_failures() << "\n";
  std::cout << "interval_s=" << s.interval().seconds() << "\n";
  std::cout << "probe_timeout_ms=" << s.probe_timeout().seconds() * 1000 + s.probe_timeout().nanos() / 1000000 << "\n";
  std::cout << "max_concurrency=" << s.max_concurrency() << "\n";
  if (s.has_last_cycle()) {
    const auto& c = s.last_cycle();
    std::cout << "last_cycle=" << c.cycle_id() << " devices=" << c.device_count() << " success=" << c.success_count()
              << " failed=" << c.failure_count() << " rate=" << std::fixed << std::setprecision(1) << c.success_rate() << "%";
    if (!c.error().empty()) std::cout << " error=\"" << c.error() << "\"";
    std::cout << "\n";
  }
}

static void PrintSummary(const TimeoutSummary& s) {
  std::cout << "failing=" << s.total_timeout_devices() << "\n";
  std::cout << "max_streak=" << s.max_consecutive_timeouts() << "\n";
  std::cout << "avg_streak=" << std::fixed << std::setprecision(2) << s.average_consecutive_timeouts() << "\n";
  std::cout << "high=" << s.devices_with_high_timeouts() << "\n";
  std::cout << "critical=" << s.critical_devices() << "\n";
  std::cout << "threshold=" << s.alert_threshold() << "\n";
}

static void PrintRecord(const TimeoutRecord& r) {
  std::cout << r.address() << "\t" << (r.hostname().empty() ? "-" : r.hostname()) << "\tstreak=" << r.consecutive_timeouts()
            << "\tsince=" << FormatTime(r.first_timeout()) << "\talerts=" << r.alert_count() << "\n";
}

static void PrintResult(const ProbeResult& r) {
  std::cout << FormatTime(r.timestamp()) << "\t" << r.address() << "\t" << (r.hostname().empty() ? "-" : r.hostname()) << "\t";
  if (r.success()) {
    std::cout << "ok " << std::fixed << std::setprecision(2) << r.latency_ms() << "ms\n";
  } else {
    std::cout << "FAIL " << r.error_message() << "\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = MonitorService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusRequest  req;
    GetStatusResponse resp;

    auto status = stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintScheduler(resp.scheduler());
    PrintSummary(resp.timeouts());
    std::cout << "tracking=" << (resp.tracking_enabled() ? "on" : "off") << "\n";
    std::cout << "alerting=" << (resp.alerting_enabled() ? "on" : "off") << "\n";
    std::cout << "output_dir=" << resp.output_dir() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    StartPollingRequest  req;
    StartPollingResponse resp;

    auto status = stub->StartPolling(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.already_running() ? "already running" : "started") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    StopPollingRequest  req;
    StopPollingResponse resp;

    auto status = stub->StopPolling(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.already_stopped() ? "already stopped" : "stopped") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    GetTimeoutSummaryRequest  req;
    GetTimeoutSummaryResponse resp;

    auto status = stub->GetTimeoutSummary(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSummary(resp.summary());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "timeouts") {
    ListTimeoutsRequest req;
    if (argc >= 4) {
      auto min = ParseCount(argv[3]);
      if (!min) {
        std::cerr << "invalid min_consecutive: " << argv[3] << "\n";
        return 1;
      }
      req.set_min_consecutive(*min);
    }
    ListTimeoutsResponse resp;

    auto status = stub->ListTimeouts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.records()) PrintRecord(record);
    std::cout << "count=" << resp.records_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "critical") {
    ListCriticalTimeoutsRequest req;
    if (argc >= 4) {
      auto threshold = ParseCount(argv[3]);
      if (!threshold) {
        std::cerr << "invalid threshold: " << argv[3] << "\n";
        return 1;
      }
      req.set_threshold(*threshold);
    }
    ListCriticalTimeoutsResponse resp;

    auto status = stub->ListCriticalTimeouts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.records()) PrintRecord(record);
    std::cout << "threshold=" << resp.threshold() << " count=" << resp.records_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reset") {
    ResetTimeoutsRequest  req;
    ResetTimeoutsResponse resp;

    auto status = stub->ResetTimeouts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared=" << resp.cleared() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "latest") {
    GetLatestResultsRequest req;
    if (argc >= 4) {
      auto limit = ParseCount(argv[3]);
      if (!limit) {
        std::cerr << "invalid limit: " << argv[3] << "\n";
        return 1;
      }
      req.set_limit(*limit);
    }
    GetLatestResultsResponse resp;

    auto status = stub->GetLatestResults(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& result : resp.results()) PrintResult(result);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "device") {
    if (argc < 4) return 1;

    GetDeviceResultsRequest req;
    req.set_device_id(argv[3]);
    if (argc >= 5) {
      auto hours = ParseCount(argv[4]);
      if (!hours) {
        std::cerr << "invalid hours: " << argv[4] << "\n";
        return 1;
      }
      req.set_hours(*hours);
    }
    GetDeviceResultsResponse resp;

    auto status = stub->GetDeviceResults(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& result : resp.results()) PrintResult(result);
    std::cout << "count=" << resp.results_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "partitions") {
    ListPartitionsRequest  req;
    ListPartitionsResponse resp;

    auto status = stub->ListPartitions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& p : resp.partitions()) {
      std::cout << p.file_name() << "\trecords=" << p.record_count() << "\tbytes=" << p.size_bytes()
                << "\tmodified=" << FormatTime(p.last_modified()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "rebuild") {
    if (argc < 4) return 1;

    RebuildPartitionRequest req;
    req.set_date(argv[3]);
    RebuildPartitionResponse resp;

    auto status = stub->RebuildPartition(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "kept=" << resp.kept() << " dropped=" << resp.dropped() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "probe") {
    if (argc < 4) return 1;

    TestProbeRequest req;
    req.set_address(argv[3]);
    if (argc >= 5) {
      auto timeout_ms = ParseCount(argv[4]);
      if (!timeout_ms) {
        std::cerr << "invalid timeout_ms: " << argv[4] << "\n";
        return 1;
      }
      req.mutable_timeout()->set_seconds(*timeout_ms / 1000);
      req.mutable_timeout()->set_nanos(static_cast<int32_t>(*timeout_ms % 1000) * 1000000);
    }
    TestProbeResponse resp;

    auto status = stub->TestProbe(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintResult(resp.result());
    return resp.result().success() ? 0 : 3;
  }

  Usage();
  return 1;
}
