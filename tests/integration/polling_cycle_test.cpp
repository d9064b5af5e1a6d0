#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_validator.hpp"
#include "internal/factory.hpp"
#include "internal/inventory/static_inventory.hpp"
#include "internal/tracking/timeout_state_file.hpp"

namespace {

using namespace std::chrono_literals;
using fleetwatch::runtime::config::RuntimeConfig;

// 10.0.0.3 stays down; 10.0.0.2 recovers after `outage` probes.
class ScriptedProber final : public fleetwatch::probe::Prober {
 public:
  explicit ScriptedProber(int outage) : outage_(outage) {
  }

  fleetwatch::probe::ProbeOutcome Probe(const std::string& address, std::chrono::milliseconds) override {
    if (address == "10.0.0.3") {
      return fleetwatch::probe::ProbeOutcome::Failed(fleetwatch::probe::kReasonTimeout);
    }
    if (address == "10.0.0.2" && probes_of_two_.fetch_add(1) < outage_) {
      return fleetwatch::probe::ProbeOutcome::Failed(fleetwatch::probe::kReasonUnreachable);
    }
    return fleetwatch::probe::ProbeOutcome::Reachable(1.5);
  }

 private:
  int              outage_;
  std::atomic<int> probes_of_two_{0};
};

std::filesystem::path OutputDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fleetwatch_polling_cycle_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

RuntimeConfig MakeConfig(const std::filesystem::path& output_dir, uint32_t threshold) {
  RuntimeConfig config;
  config.mutable_store()->set_output_dir(output_dir.string());
  config.mutable_alerting()->set_threshold(threshold);
  config.mutable_inventory()->mutable_static_list();
  fleetwatch::config::ApplyDefaults(&config);
  fleetwatch::config::Validate(config);
  return config;
}

std::shared_ptr<fleetwatch::inventory::StaticInventory> MakeInventory() {
  std::vector<fleetwatch::inventory::InventoryRow> rows = {
      {"1", "10.0.0.1", "lab-pc-01", "Lenovo", "Windows 10", "baik"},
      {"2", "10.0.0.2", "lab-pc-02", "Lenovo", "Windows 10", "baik"},
      {"3", "10.0.0.3", "printer-03", "Epson", "", "maintenance"},
      {"4", "10.0.0.4", "lab-pc-04", "Lenovo", "Windows 10", "hilang"},
      {"5", "10.0.0.1", "dup-of-1", "", "", "baik"},
  };
  return std::make_shared<fleetwatch::inventory::StaticInventory>(rows);
}

void TestCyclesFlowIntoStoreAndTracker() {
  const auto dir = OutputDir("flow");
  auto       app = fleetwatch::factory::Build(MakeConfig(dir, 3), std::make_shared<ScriptedProber>(2), MakeInventory());

  for (int i = 0; i < 4; ++i) {
    const auto report = app.context.scheduler->RunCycleNow();
    assert(report.has_value());
    assert(report->inventory_ok && report->store_ok && report->tracker_ok);
    // missing and duplicate entries are not polled
    assert(report->device_count == 3);
  }

  // every probe result was persisted, in order, newest first through Latest
  const auto latest = app.context.store->Latest(1000);
  assert(latest.size() == 12);
  assert(latest[0].timestamp >= latest.back().timestamp);

  const auto history = app.context.store->ForDevice("2", fleetwatch::util::Now() - 1h);
  assert(history.size() == 4);
  assert(history[0].success);
  assert(history[1].success);
  assert(!history[2].success && history[2].error_message == std::string("unreachable"));
  assert(!history[3].success);

  // tracker agrees with the stored history
  const auto summary = app.context.tracker->Summary();
  assert(summary.total_timeout_devices == 1);
  assert(summary.max_consecutive_timeouts == 4);
  assert(summary.critical_devices == 1);
  assert(!app.context.tracker->Find("10.0.0.2").has_value());

  app.context.tracker->WaitForDeliveries();
  const auto critical = app.context.tracker->Critical();
  assert(critical.size() == 1);
  assert(critical[0].record.address == "10.0.0.3");
  assert(critical[0].record.brand == "Epson");
  assert(critical[0].record.condition == fleetwatch::model::Condition::kMaintenance);
  // alerted once at the third failure through the log notifier
  assert(critical[0].alert.alert_count == 1);

  const auto state = fleetwatch::tracking::LoadState(dir / "timeout_tracking.csv");
  assert(state.size() == 1);
  assert(state[0].address == "10.0.0.3");
  assert(state[0].consecutive_timeouts == 4);

  const auto status = app.context.scheduler->Status();
  assert(status.cycles_completed == 4);
  assert(status.last_cycle->success_count == 2);
  assert(status.last_cycle->failure_count == 1);
}

void TestTrackerResumesFromStateFile() {
  const auto dir = OutputDir("resume");
  {
    auto app = fleetwatch::factory::Build(MakeConfig(dir, 5), std::make_shared<ScriptedProber>(0), MakeInventory());
    app.context.scheduler->RunCycleNow();
    app.context.scheduler->RunCycleNow();
  }

  auto app = fleetwatch::factory::Build(MakeConfig(dir, 5), std::make_shared<ScriptedProber>(0), MakeInventory());
  assert(app.context.tracker->Find("10.0.0.3")->consecutive_timeouts == 2);

  app.context.scheduler->RunCycleNow();
  assert(app.context.tracker->Find("10.0.0.3")->consecutive_timeouts == 3);
  assert(app.context.store->Latest(1000).size() == 9);
}

void TestScheduledPollingRuns() {
  const auto dir    = OutputDir("scheduled");
  auto       config = MakeConfig(dir, 5);
  *config.mutable_polling()->mutable_interval() = fleetwatch::util::ToProto(50ms);

  auto app = fleetwatch::factory::Build(config, std::make_shared<ScriptedProber>(0), MakeInventory());
  assert(app.context.scheduler->Start());
  std::this_thread::sleep_for(300ms);
  assert(app.context.scheduler->Stop());

  const auto status = app.context.scheduler->Status();
  assert(status.cycles_completed >= 2);
  assert(app.context.store->Latest(100000).size() == status.cycles_completed * 3);
  assert(app.context.tracker->Find("10.0.0.3")->consecutive_timeouts == status.cycles_completed);
}

} // namespace

int main() {
  TestCyclesFlowIntoStoreAndTracker();
  TestTrackerResumesFromStateFile();
  TestScheduledPollingRuns();

  std::cout << "fleetwatch_integration_polling_cycle: pass\n";
  return 0;
}
