#include "cycle_scheduler.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fleetwatch::scheduler {

using fleetwatch::observability::BoolField;
using fleetwatch::observability::DoubleField;
using fleetwatch::observability::IntField;
using fleetwatch::observability::StringField;

namespace {

// Clears the cycle flag on every exit path.
class CycleGuard {
 public:
  explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~CycleGuard() {
    flag_.store(false);
  }

  CycleGuard(const CycleGuard&)            = delete;
  CycleGuard& operator=(const CycleGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

std::size_t Signature(const std::vector<model::Device>& devices) {
  std::vector<std::string> keys;
  keys.reserve(devices.size());
  for (const auto& device : devices) {
    keys.push_back(device.id + '|' + device.address + '|' + std::string(model::ToString(device.condition)));
  }
  std::sort(keys.begin(), keys.end());

  std::size_t seed = keys.size();
  for (const auto& key : keys) {
    seed ^= std::hash<std::string>{}(key) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  return seed;
}

} // namespace

std::string_view ToString(SchedulerState state) {
  switch (state) {
    case SchedulerState::kIdle:
      return "idle";
    case SchedulerState::kRunning:
      return "running";
    case SchedulerState::kStopped:
      return "stopped";
  }
  return "unknown";
}

Selection SelectPollable(const std::vector<model::Device>& devices) {
  Selection                       out;
  std::unordered_set<std::string> addresses;

  for (const auto& device : devices) {
    if (device.condition == model::Condition::kMissing) {
      ++out.missing;
      continue;
    }
    if (!model::IsValidAddress(device.address)) {
      ++out.invalid;
      continue;
    }
    if (!addresses.insert(device.address).second) {
      ++out.duplicate;
      continue;
    }
    out.devices.push_back(device);
  }
  return out;
}

void ComputeStatistics(const std::vector<model::ProbeResult>& results, CycleReport* report) {
  report->device_count  = results.size();
  report->success_count = 0;
  report->failure_count = 0;

  double      latency_sum   = 0.0;
  std::size_t latency_count = 0;
  for (const auto& result : results) {
    if (!result.success) {
      ++report->failure_count;
      continue;
    }
    ++report->success_count;
    if (!result.latency_ms) continue;

    const double latency = *result.latency_ms;
    latency_sum += latency;
    ++latency_count;
    report->min_latency_ms = report->min_latency_ms ? std::min(*report->min_latency_ms, latency) : latency;
    report->max_latency_ms = report->max_latency_ms ? std::max(*report->max_latency_ms, latency) : latency;
  }

  report->success_rate =
      results.empty() ? 0.0 : static_cast<double>(report->success_count) * 100.0 / static_cast<double>(results.size());
  if (latency_count > 0) {
    report->avg_latency_ms = latency_sum / static_cast<double>(latency_count);
  }
}

CycleScheduler::CycleScheduler(std::shared_ptr<inventory::Inventory> inventory, std::shared_ptr<dispatch::Dispatcher> dispatcher,
                               std::shared_ptr<store::ResultStore> store, std::shared_ptr<tracking::TimeoutTracker> tracker,
                               SchedulerOptions options)
    : inventory_(std::move(inventory)),
      dispatcher_(std::move(dispatcher)),
      store_(std::move(store)),
      tracker_(std::move(tracker)),
      options_(options) {
  if (!inventory_ || !dispatcher_ || !store_ || !tracker_) {
    throw std::invalid_argument("cycle scheduler requires inventory, dispatcher, store and tracker");
  }
  if (options_.interval.count() <= 0) {
    throw std::invalid_argument("polling interval must be positive");
  }
}

CycleScheduler::~CycleScheduler() {
  Stop();
}

bool CycleScheduler::Start() {
  std::lock_guard control(control_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (started_) return false;
    started_       = true;
    stop_ticker_   = false;
    stop_runner_   = false;
    cycle_pending_ = false;
  }

  runner_ = std::thread(&CycleScheduler::RunnerLoop, this);
  ticker_ = std::thread(&CycleScheduler::TickerLoop, this);

  FLEETWATCH_LOG_INFO("Polling started", {IntField("interval_ms", options_.interval.count())});
  return true;
}

bool CycleScheduler::Stop() {
  std::lock_guard control(control_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (!started_) return false;
    stop_ticker_ = true;
  }
  ticker_cv_.notify_all();
  if (ticker_.joinable()) ticker_.join();

  // runner finishes a pending or in-flight cycle before it exits
  {
    std::lock_guard lock(mutex_);
    stop_runner_ = true;
  }
  runner_cv_.notify_all();
  if (runner_.joinable()) runner_.join();

  {
    std::lock_guard lock(mutex_);
    started_ = false;
  }

  FLEETWATCH_LOG_INFO("Polling stopped", {IntField("cycles_completed", static_cast<std::int64_t>(cycles_completed_.load()))});
  return true;
}

void CycleScheduler::TickerLoop() {
  auto next = std::chrono::steady_clock::now();

  std::unique_lock lock(mutex_);
  while (!stop_ticker_) {
    lock.unlock();
    Tick();
    lock.lock();

    next += options_.interval;
    const auto now = std::chrono::steady_clock::now();
    if (next + options_.interval < now) {
      // clock jumped (suspend); resume the cadence from now
      next = now + options_.interval;
    }
    ticker_cv_.wait_until(lock, next, [this] { return stop_ticker_; });
  }
}

void CycleScheduler::Tick() {
  bool expected = false;
  if (!cycle_in_progress_.compare_exchange_strong(expected, true)) {
    const auto skipped = ++ticks_skipped_;
    observability::Metrics::Instance().RecordSkippedTick();
    FLEETWATCH_LOG_WARN("Tick skipped, previous cycle still running", {IntField("ticks_skipped", static_cast<std::int64_t>(skipped))});
    return;
  }

  {
    std::lock_guard lock(mutex_);
    cycle_pending_ = true;
  }
  runner_cv_.notify_one();
}

void CycleScheduler::RunnerLoop() {
  std::unique_lock lock(mutex_);
  for (;;) {
    runner_cv_.wait(lock, [this] { return cycle_pending_ || stop_runner_; });
    if (cycle_pending_) {
      cycle_pending_ = false;
      lock.unlock();
      {
        CycleGuard guard(cycle_in_progress_);
        RunGuarded();
      }
      lock.lock();
      continue;
    }
    if (stop_runner_) break;
  }
}

std::optional<CycleReport> CycleScheduler::RunCycleNow() {
  bool expected = false;
  if (!cycle_in_progress_.compare_exchange_strong(expected, true)) {
    return std::nullopt;
  }
  CycleGuard guard(cycle_in_progress_);
  return RunGuarded();
}

SchedulerStatus CycleScheduler::Status() const {
  SchedulerStatus status;
  status.options            = options_;
  status.cycles_completed   = cycles_completed_.load();
  status.ticks_skipped      = ticks_skipped_.load();
  status.inventory_failures = inventory_failures_.load();

  std::lock_guard lock(mutex_);
  if (cycle_in_progress_.load()) {
    status.state = SchedulerState::kRunning;
  } else {
    status.state = started_ ? SchedulerState::kIdle : SchedulerState::kStopped;
  }
  status.last_cycle = last_report_;
  return status;
}

CycleReport CycleScheduler::RunGuarded() {
  const auto start = std::chrono::steady_clock::now();
  try {
    return ExecuteCycle();
  } catch (const std::exception& e) {
    FLEETWATCH_LOG_ERROR("Cycle aborted", {StringField("error", e.what())});
    CycleReport report;
    report.cycle_id   = ++cycle_seq_;
    report.started_at = util::Now();
    report.error      = e.what();
    Finish(report, start);
    return report;
  }
}

CycleReport CycleScheduler::ExecuteCycle() {
  const auto start = std::chrono::steady_clock::now();

  CycleReport report;
  report.cycle_id   = ++cycle_seq_;
  report.started_at = util::Now();

  observability::SpanScope span("fleetwatch.cycle");
  span.SetAttribute("cycle.id", static_cast<std::int64_t>(report.cycle_id));

  FLEETWATCH_LOG_DEBUG("Cycle started", {IntField("cycle", static_cast<std::int64_t>(report.cycle_id))});

  std::vector<model::Device> inventory;
  try {
    inventory = inventory_->ListDevices();
  } catch (const std::exception& e) {
    ++inventory_failures_;
    report.inventory_ok = false;
    report.error        = std::string("inventory: ") + e.what();
    span.RecordException(report.error);
    FLEETWATCH_LOG_ERROR("Inventory fetch failed", {IntField("cycle", static_cast<std::int64_t>(report.cycle_id)), StringField("error", e.what())});
    Finish(report, start);
    return report;
  }

  auto selection = SelectPollable(inventory);
  if (selection.missing + selection.invalid + selection.duplicate > 0) {
    FLEETWATCH_LOG_DEBUG("Devices excluded from polling", {IntField("missing", static_cast<std::int64_t>(selection.missing)),
                                                           IntField("invalid", static_cast<std::int64_t>(selection.invalid)),
                                                           IntField("duplicate", static_cast<std::int64_t>(selection.duplicate))});
  }
  TrackDeviceSet(selection.devices);

  if (selection.devices.empty()) {
    FLEETWATCH_LOG_WARN("No pollable devices", {IntField("inventory", static_cast<std::int64_t>(inventory.size()))});
    Finish(report, start);
    return report;
  }

  const auto results = dispatcher_->Dispatch(selection.devices);
  ComputeStatistics(results, &report);
  span.SetAttribute("cycle.devices", static_cast<std::int64_t>(report.device_count));

  try {
    store_->Append(results);
  } catch (const std::exception& e) {
    report.store_ok = false;
    report.error    = std::string("store: ") + e.what();
    span.RecordException(report.error);
    FLEETWATCH_LOG_ERROR("Result store append failed", {IntField("cycle", static_cast<std::int64_t>(report.cycle_id)), StringField("error", e.what())});
  }

  try {
    const auto applied = tracker_->ApplyCycle(results, selection.devices, util::Now());
    if (!applied.state_saved) {
      report.tracker_ok = false;
      if (report.error.empty()) report.error = "tracker: state file not written";
    }
  } catch (const std::exception& e) {
    report.tracker_ok = false;
    if (!report.error.empty()) report.error += "; ";
    report.error += std::string("tracker: ") + e.what();
    span.RecordException(e.what());
    FLEETWATCH_LOG_ERROR("Timeout tracker update failed", {IntField("cycle", static_cast<std::int64_t>(report.cycle_id)), StringField("error", e.what())});
  }

  MaybePrune(report.started_at);
  Finish(report, start);
  return report;
}

void CycleScheduler::Finish(CycleReport& report, std::chrono::steady_clock::time_point start) {
  report.finished_at = util::Now();
  const double duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

  auto& metrics = observability::Metrics::Instance();
  metrics.ObserveCycleDurationMs(duration_ms);
  metrics.RecordProbeOutcomes(report.success_count, report.failure_count);

  ++cycles_completed_;
  {
    std::lock_guard lock(mutex_);
    last_report_ = report;
  }

  if (report.device_count == 0) return;

  FLEETWATCH_LOG_INFO("Cycle completed", {IntField("cycle", static_cast<std::int64_t>(report.cycle_id)),
                                          IntField("devices", static_cast<std::int64_t>(report.device_count)),
                                          IntField("success", static_cast<std::int64_t>(report.success_count)),
                                          IntField("failed", static_cast<std::int64_t>(report.failure_count)),
                                          DoubleField("success_rate", report.success_rate),
                                          DoubleField("avg_latency_ms", report.avg_latency_ms.value_or(0.0)),
                                          DoubleField("duration_ms", duration_ms), BoolField("store_ok", report.store_ok),
                                          BoolField("tracker_ok", report.tracker_ok)});
}

void CycleScheduler::TrackDeviceSet(const std::vector<model::Device>& devices) {
  const std::size_t signature = Signature(devices);
  if (have_signature_ && signature == device_signature_) return;

  FLEETWATCH_LOG_INFO(have_signature_ ? "Device set changed" : "Device set loaded",
                      {IntField("devices", static_cast<std::int64_t>(devices.size()))});
  device_signature_ = signature;
  have_signature_   = true;
}

void CycleScheduler::MaybePrune(util::TimePoint now) {
  if (options_.retention_days == 0) return;

  const std::string today = util::DayKey(now);
  if (today == last_prune_day_) return;
  last_prune_day_ = today;

  try {
    const auto removed = store_->PruneOlderThan(options_.retention_days, now);
    if (removed > 0) {
      FLEETWATCH_LOG_INFO("Expired result partitions removed", {IntField("removed", static_cast<std::int64_t>(removed))});
    }
  } catch (const std::exception& e) {
    FLEETWATCH_LOG_WARN("Result partition pruning failed", {StringField("error", e.what())});
  }
}

} // namespace fleetwatch::scheduler
