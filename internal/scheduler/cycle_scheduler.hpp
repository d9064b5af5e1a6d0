#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/inventory/inventory.hpp"
#include "internal/model/device.hpp"
#include "internal/store/result_store.hpp"
#include "internal/tracking/timeout_tracker.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::scheduler {

struct SchedulerOptions {
  std::chrono::milliseconds interval{5000};
  // result partitions older than this are deleted once a day; 0 keeps all
  uint32_t                  retention_days{30};
};

enum class SchedulerState {
  kIdle,
  kRunning,
  kStopped,
};

std::string_view ToString(SchedulerState state);

struct CycleReport {
  uint64_t              cycle_id{0};
  util::TimePoint       started_at;
  util::TimePoint       finished_at;
  std::size_t           device_count{0};
  std::size_t           success_count{0};
  std::size_t           failure_count{0};
  double                success_rate{0.0};
  std::optional<double> avg_latency_ms;
  std::optional<double> min_latency_ms;
  std::optional<double> max_latency_ms;
  bool                  inventory_ok{true};
  bool                  store_ok{true};
  bool                  tracker_ok{true};
  std::string           error;
};

struct SchedulerStatus {
  SchedulerState             state{SchedulerState::kStopped};
  uint64_t                   cycles_completed{0};
  uint64_t                   ticks_skipped{0};
  uint64_t                   inventory_failures{0};
  SchedulerOptions           options;
  std::optional<CycleReport> last_cycle;
};

struct Selection {
  std::vector<model::Device> devices;
  std::size_t                missing{0};
  std::size_t                invalid{0};
  std::size_t                duplicate{0};
};

// Drops missing devices, unusable addresses and repeated addresses (first wins).
Selection SelectPollable(const std::vector<model::Device>& devices);

// Success/failure counts and latency spread of one batch.
void ComputeStatistics(const std::vector<model::ProbeResult>& results, CycleReport* report);

/*
  CycleScheduler

  Fixed-period control loop. A ticker thread fires every interval (first
  tick right after Start) and hands the cycle to a runner thread. A tick
  that finds a cycle still in progress is dropped and counted, never
  queued, so at most one cycle runs at a time.

  Each cycle:
      inventory → filter → dispatch → store append → tracker apply

  Store and tracker failures are isolated from each other and reported in
  the CycleReport. Nothing thrown inside a cycle leaves the runner thread.

  Stop() halts the ticker and lets an in-flight cycle finish before the
  scheduler reports Stopped.
*/
class CycleScheduler {
 public:
  CycleScheduler(std::shared_ptr<inventory::Inventory> inventory, std::shared_ptr<dispatch::Dispatcher> dispatcher,
                 std::shared_ptr<store::ResultStore> store, std::shared_ptr<tracking::TimeoutTracker> tracker, SchedulerOptions options);
  ~CycleScheduler();

  CycleScheduler(const CycleScheduler&)            = delete;
  CycleScheduler& operator=(const CycleScheduler&) = delete;

  // false when already running
  bool Start();

  // false when already stopped
  bool Stop();

  // Runs one cycle on the caller's thread; nullopt when a cycle is in progress.
  std::optional<CycleReport> RunCycleNow();

  SchedulerStatus Status() const;

 private:
  void TickerLoop();
  void RunnerLoop();
  void Tick();

  CycleReport RunGuarded();
  CycleReport ExecuteCycle();
  void        Finish(CycleReport& report, std::chrono::steady_clock::time_point start);
  void        TrackDeviceSet(const std::vector<model::Device>& devices);
  void        MaybePrune(util::TimePoint now);

  std::shared_ptr<inventory::Inventory>     inventory_;
  std::shared_ptr<dispatch::Dispatcher>     dispatcher_;
  std::shared_ptr<store::ResultStore>       store_;
  std::shared_ptr<tracking::TimeoutTracker> tracker_;
  SchedulerOptions                          options_;

  // serializes Start/Stop
  std::mutex control_mutex_;

  mutable std::mutex         mutex_;
  std::condition_variable    ticker_cv_;
  std::condition_variable    runner_cv_;
  bool                       started_       = false;
  bool                       stop_ticker_   = false;
  bool                       stop_runner_   = false;
  bool                       cycle_pending_ = false;
  std::optional<CycleReport> last_report_;
  std::thread                ticker_;
  std::thread                runner_;

  std::atomic<bool>     cycle_in_progress_{false};
  std::atomic<uint64_t> cycle_seq_{0};
  std::atomic<uint64_t> cycles_completed_{0};
  std::atomic<uint64_t> ticks_skipped_{0};
  std::atomic<uint64_t> inventory_failures_{0};

  // touched only by the holder of cycle_in_progress_
  std::size_t device_signature_ = 0;
  bool        have_signature_   = false;
  std::string last_prune_day_;
};

} // namespace fleetwatch::scheduler
