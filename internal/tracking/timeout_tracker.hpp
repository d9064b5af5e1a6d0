#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/device.hpp"
#include "internal/model/probe_result.hpp"
#include "internal/model/timeout_record.hpp"
#include "internal/notify/alert_queue.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::tracking {

// Streak length above which a device counts as "high" in the summary.
constexpr uint32_t kHighTimeoutMark = 10;

struct TrackerOptions {
  bool                      enabled{true};
  bool                      alerting_enabled{true};
  uint32_t                  threshold{5};
  std::chrono::milliseconds cooldown{std::chrono::hours(1)};
  bool                      recovery_notice{false};
  std::vector<std::string>  recipients;
  // empty: state is kept in memory only
  std::filesystem::path     state_path;
};

struct TimeoutEntry {
  model::TimeoutRecord record;
  model::AlertState    alert;
};

struct TimeoutSummary {
  std::size_t total_timeout_devices{0};
  uint32_t    max_consecutive_timeouts{0};
  double      average_consecutive_timeouts{0.0};
  std::size_t devices_with_high_timeouts{0};
  std::size_t critical_devices{0};
  uint32_t    alert_threshold{0};
};

struct ApplyReport {
  std::size_t failing{0};
  std::size_t recovered{0};
  std::size_t pruned{0};
  std::size_t alerts_queued{0};
  bool        state_saved{true};
};

/*
  Per-address failure streaks and alert bookkeeping.

  ApplyCycle computes the next state on a copy and swaps it in under the
  exclusive lock, so queries see a cycle fully applied or not at all.
  Writers (ApplyCycle, Reset, delivery bookkeeping) are serialized and
  none of them holds a lock across notifier calls.

  Alerts raised by a cycle are handed to a delivery thread. AlertState is
  recorded when at least one recipient accepted the alert, so a failing
  notifier leaves the cooldown open. An address with an alert still
  waiting for delivery raises no further alert. Because delivery finishes
  after the cycle that raised it, a query may see a streak past the
  threshold while alert_count still holds its previous value.
*/
class TimeoutTracker {
 public:
  TimeoutTracker(TrackerOptions options, std::shared_ptr<notify::Notifier> notifier);
  ~TimeoutTracker();

  TimeoutTracker(const TimeoutTracker&)            = delete;
  TimeoutTracker& operator=(const TimeoutTracker&) = delete;

  ApplyReport ApplyCycle(const std::vector<model::ProbeResult>& results, const std::vector<model::Device>& devices,
                         util::TimePoint now = util::Now());

  TimeoutSummary Summary() const;

  // streak >= min_consecutive, highest streak first
  std::vector<TimeoutEntry> List(uint32_t min_consecutive = 1) const;

  // 0 uses the configured alert threshold
  std::vector<TimeoutEntry> Critical(uint32_t threshold = 0) const;

  // Drops every record and alert state. Returns the number of records cleared.
  std::size_t Reset();

  std::optional<model::TimeoutRecord> Find(const std::string& address) const;

  // Blocks until every alert queued so far has been handed to the notifier.
  void WaitForDeliveries();

  const TrackerOptions& options() const {
    return options_;
  }

 private:
  using RecordMap = std::unordered_map<std::string, model::TimeoutRecord>;
  using AlertMap  = std::unordered_map<std::string, model::AlertState>;

  void Load();
  bool Persist(const RecordMap& records);
  bool CooldownElapsed(const AlertMap& alerts, const std::string& address, util::TimePoint now) const;
  void DeliveryLoop();
  bool Deliver(const notify::AlertEvent& event);
  void RecordDelivery(const notify::AlertEvent& event, bool sent);

  TrackerOptions                    options_;
  std::shared_ptr<notify::Notifier> notifier_;

  std::mutex                writer_mutex_;
  mutable std::shared_mutex mutex_;
  RecordMap                 records_;
  AlertMap                  alerts_;

  // timeout alerts queued but not yet delivered; guarded by writer_mutex_
  std::unordered_set<std::string> awaiting_delivery_;

  notify::AlertQueue alert_queue_;
  std::thread        delivery_thread_;
};

} // namespace fleetwatch::tracking
