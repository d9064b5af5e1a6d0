#include "timeout_tracker.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/notify/alert_message.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/tracking/timeout_state_file.hpp"
#include "internal/util/errors.hpp"

namespace fleetwatch::tracking {

using fleetwatch::observability::IntField;
using fleetwatch::observability::StringField;

namespace {

void RefreshContext(model::TimeoutRecord& record, const model::ProbeResult& result, const model::Device* device) {
  record.address   = result.address;
  record.hostname  = result.hostname;
  record.device_id = result.device_id;
  if (device) {
    record.brand     = device->brand;
    record.os        = device->os;
    record.condition = device->condition;
  }
}

} // namespace

TimeoutTracker::TimeoutTracker(TrackerOptions options, std::shared_ptr<notify::Notifier> notifier)
    : options_(std::move(options)), notifier_(std::move(notifier)) {
  if (options_.threshold == 0) {
    throw std::invalid_argument("alert threshold must be at least 1");
  }
  if (options_.cooldown.count() < 0) {
    throw std::invalid_argument("alert cooldown must not be negative");
  }
  if (options_.enabled && options_.alerting_enabled && !notifier_) {
    throw std::invalid_argument("alerting requires a notifier");
  }

  if (options_.enabled) {
    Load();
  }
  if (options_.enabled && options_.alerting_enabled) {
    delivery_thread_ = std::thread([this] { DeliveryLoop(); });
  }
}

TimeoutTracker::~TimeoutTracker() {
  const std::size_t dropped = alert_queue_.Shutdown();
  if (delivery_thread_.joinable()) delivery_thread_.join();
  if (dropped > 0) {
    FLEETWATCH_LOG_WARN("Undelivered alerts dropped", {IntField("alerts", static_cast<std::int64_t>(dropped))});
  }
}

void TimeoutTracker::Load() {
  if (options_.state_path.empty()) return;

  std::size_t malformed = 0;
  try {
    for (auto& record : LoadState(options_.state_path, &malformed)) {
      records_.emplace(record.address, std::move(record));
    }
  } catch (const util::StoreError& e) {
    FLEETWATCH_LOG_WARN("Timeout state unreadable, starting empty",
                        {StringField("path", options_.state_path.string()), StringField("error", e.what())});
    records_.clear();
    return;
  }

  if (malformed > 0) {
    FLEETWATCH_LOG_WARN("Skipped malformed timeout state rows", {IntField("rows", static_cast<std::int64_t>(malformed))});
  }
  FLEETWATCH_LOG_INFO("Timeout state loaded", {StringField("path", options_.state_path.string()),
                                               IntField("devices", static_cast<std::int64_t>(records_.size()))});
}

bool TimeoutTracker::Persist(const RecordMap& records) {
  if (options_.state_path.empty()) return true;

  std::vector<model::TimeoutRecord> rows;
  rows.reserve(records.size());
  for (const auto& [address, record] : records) rows.push_back(record);

  try {
    SaveState(options_.state_path, std::move(rows));
    return true;
  } catch (const util::StoreError& e) {
    FLEETWATCH_LOG_ERROR("Timeout state write failed", {StringField("path", options_.state_path.string()), StringField("error", e.what())});
    return false;
  }
}

bool TimeoutTracker::CooldownElapsed(const AlertMap& alerts, const std::string& address, util::TimePoint now) const {
  auto it = alerts.find(address);
  if (it == alerts.end() || !it->second.last_alert_sent_at) return true;
  return now - *it->second.last_alert_sent_at >= options_.cooldown;
}

ApplyReport TimeoutTracker::ApplyCycle(const std::vector<model::ProbeResult>& results, const std::vector<model::Device>& devices,
                                       util::TimePoint now) {
  ApplyReport report;
  if (!options_.enabled) return report;

  std::lock_guard writer(writer_mutex_);

  std::unordered_map<std::string, const model::Device*> by_address;
  for (const auto& device : devices) by_address.emplace(device.address, &device);

  RecordMap next_records;
  AlertMap  next_alerts;
  {
    std::shared_lock lock(mutex_);
    next_records = records_;
    next_alerts  = alerts_;
  }

  std::vector<notify::AlertEvent> events;
  std::unordered_set<std::string> seen;

  for (const auto& result : results) {
    if (result.address.empty()) continue;
    seen.insert(result.address);

    auto it = next_records.find(result.address);

    if (result.success) {
      if (it == next_records.end()) continue;

      auto alert = next_alerts.find(result.address);
      if (options_.alerting_enabled && options_.recovery_notice && alert != next_alerts.end() && alert->second.alert_count > 0) {
        events.push_back(notify::AlertEvent{notify::AlertKind::kRecovery, it->second, now});
      }
      FLEETWATCH_LOG_INFO("Device recovered", {StringField("address", result.address),
                                               IntField("consecutive_timeouts", it->second.consecutive_timeouts)});
      next_records.erase(it);
      next_alerts.erase(result.address);
      ++report.recovered;
      continue;
    }

    const auto  device_it = by_address.find(result.address);
    const auto* device    = device_it == by_address.end() ? nullptr : device_it->second;

    if (it == next_records.end()) {
      model::TimeoutRecord record;
      RefreshContext(record, result, device);
      record.consecutive_timeouts = 1;
      record.first_timeout        = now;
      record.last_timeout         = now;
      record.last_updated         = now;
      it                          = next_records.emplace(result.address, std::move(record)).first;
    } else {
      RefreshContext(it->second, result, device);
      ++it->second.consecutive_timeouts;
      it->second.last_timeout = now;
      it->second.last_updated = now;
    }

    if (options_.alerting_enabled && it->second.consecutive_timeouts >= options_.threshold &&
        awaiting_delivery_.count(result.address) == 0 && CooldownElapsed(next_alerts, result.address, now)) {
      events.push_back(notify::AlertEvent{notify::AlertKind::kTimeout, it->second, now});
    }
  }

  // devices no longer polled drop out of tracking
  for (auto it = next_records.begin(); it != next_records.end();) {
    if (by_address.count(it->first) == 0 && seen.count(it->first) == 0) {
      next_alerts.erase(it->first);
      it = next_records.erase(it);
      ++report.pruned;
    } else {
      ++it;
    }
  }

  report.failing     = next_records.size();
  report.state_saved = Persist(next_records);

  {
    std::unique_lock lock(mutex_);
    records_.swap(next_records);
    alerts_.swap(next_alerts);
  }

  observability::Metrics::Instance().SetFailingDevices(report.failing);

  report.alerts_queued = events.size();
  for (auto& event : events) {
    if (event.kind == notify::AlertKind::kTimeout) awaiting_delivery_.insert(event.record.address);
    alert_queue_.Enqueue(std::move(event));
  }

  return report;
}

void TimeoutTracker::DeliveryLoop() {
  while (auto event = alert_queue_.Dequeue()) {
    bool sent = false;
    try {
      sent = Deliver(*event);
    } catch (const std::exception& e) {
      FLEETWATCH_LOG_ERROR("Alert delivery failed", {StringField("address", event->record.address), StringField("error", e.what())});
    }
    RecordDelivery(*event, sent);
    alert_queue_.Done();
  }
}

bool TimeoutTracker::Deliver(const notify::AlertEvent& event) {
  const std::size_t delivered = notify::Broadcast(*notifier_, options_.recipients, notify::FormatAlert(event));
  const bool        sent      = delivered > 0;
  observability::Metrics::Instance().RecordAlert(notify::ToString(event.kind), sent);

  if (!sent) {
    FLEETWATCH_LOG_WARN("Alert not delivered", {StringField("address", event.record.address),
                                                StringField("kind", notify::ToString(event.kind))});
  }
  return sent;
}

void TimeoutTracker::RecordDelivery(const notify::AlertEvent& event, bool sent) {
  if (event.kind != notify::AlertKind::kTimeout) return;

  const auto&     address = event.record.address;
  std::lock_guard writer(writer_mutex_);
  awaiting_delivery_.erase(address);
  if (!sent) return;

  std::unique_lock lock(mutex_);
  auto             it = records_.find(address);
  // the streak ended (or restarted) while the alert was in flight
  if (it == records_.end() || it->second.first_timeout != event.record.first_timeout) return;

  auto& state              = alerts_[address];
  state.last_alert_sent_at = event.at;
  ++state.alert_count;
  FLEETWATCH_LOG_INFO("Alert sent", {StringField("address", address),
                                     IntField("consecutive_timeouts", event.record.consecutive_timeouts),
                                     IntField("alert_count", state.alert_count)});
}

TimeoutSummary TimeoutTracker::Summary() const {
  TimeoutSummary summary;
  summary.alert_threshold = options_.threshold;

  std::shared_lock lock(mutex_);
  summary.total_timeout_devices = records_.size();
  if (records_.empty()) return summary;

  uint64_t total = 0;
  for (const auto& [address, record] : records_) {
    total += record.consecutive_timeouts;
    summary.max_consecutive_timeouts = std::max(summary.max_consecutive_timeouts, record.consecutive_timeouts);
    if (record.consecutive_timeouts > kHighTimeoutMark) ++summary.devices_with_high_timeouts;
    if (record.consecutive_timeouts >= options_.threshold) ++summary.critical_devices;
  }
  summary.average_consecutive_timeouts = static_cast<double>(total) / static_cast<double>(records_.size());
  return summary;
}

std::vector<TimeoutEntry> TimeoutTracker::List(uint32_t min_consecutive) const {
  std::vector<TimeoutEntry> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [address, record] : records_) {
      if (record.consecutive_timeouts < min_consecutive) continue;
      TimeoutEntry entry{record, {}};
      if (auto it = alerts_.find(address); it != alerts_.end()) entry.alert = it->second;
      out.push_back(std::move(entry));
    }
  }

  std::sort(out.begin(), out.end(), [](const TimeoutEntry& a, const TimeoutEntry& b) {
    if (a.record.consecutive_timeouts != b.record.consecutive_timeouts) {
      return a.record.consecutive_timeouts > b.record.consecutive_timeouts;
    }
    return a.record.address < b.record.address;
  });
  return out;
}

std::vector<TimeoutEntry> TimeoutTracker::Critical(uint32_t threshold) const {
  return List(threshold == 0 ? options_.threshold : threshold);
}

std::size_t TimeoutTracker::Reset() {
  std::lock_guard writer(writer_mutex_);

  std::size_t cleared = 0;
  {
    std::unique_lock lock(mutex_);
    cleared = records_.size();
    records_.clear();
    alerts_.clear();
  }

  const bool saved = !options_.enabled || Persist({});
  observability::Metrics::Instance().SetFailingDevices(0);

  FLEETWATCH_LOG_INFO("Timeout tracking reset",
                      {IntField("cleared", static_cast<std::int64_t>(cleared)), observability::BoolField("state_saved", saved)});
  return cleared;
}

void TimeoutTracker::WaitForDeliveries() {
  if (!delivery_thread_.joinable()) return;
  alert_queue_.WaitIdle();
}

std::optional<model::TimeoutRecord> TimeoutTracker::Find(const std::string& address) const {
  std::shared_lock lock(mutex_);
  auto             it = records_.find(address);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

} // namespace fleetwatch::tracking
