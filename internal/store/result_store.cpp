#include "result_store.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/store/arrow_io.hpp"
#include "internal/store/csv_codec.hpp"
#include "internal/util/errors.hpp"

namespace fleetwatch::store {

namespace {

constexpr const char* kPartitionPrefix = "ping_results_";
constexpr const char* kPartitionSuffix = ".csv";

const std::regex& PartitionPattern() {
  static const std::regex pattern(R"(^ping_results_(\d{8})\.csv$)");
  return pattern;
}

struct PendingWrite {
  std::filesystem::path          path;
  std::shared_ptr<arrow::Buffer> data;
  bool                           existed{false};
  std::uintmax_t                 previous_size{0};
};

void RollBack(const std::vector<PendingWrite>& writes, std::size_t touched) {
  for (std::size_t i = 0; i < touched; ++i) {
    const auto&     write = writes[i];
    std::error_code ec;
    if (write.existed) {
      std::filesystem::resize_file(write.path, write.previous_size, ec);
    } else {
      std::filesystem::remove(write.path, ec);
    }
    if (ec) {
      FLEETWATCH_LOG_ERROR("Result partition rollback failed", {observability::StringField("path", write.path.string()),
                                                                 observability::StringField("error", ec.message())});
    }
  }
}

} // namespace

ResultStore::ResultStore(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    throw util::StoreError("create output directory " + output_dir_.string() + ": " + ec.message());
  }
}

std::filesystem::path ResultStore::PartitionPath(const std::string& day) const {
  return output_dir_ / (std::string(kPartitionPrefix) + day + kPartitionSuffix);
}

void ResultStore::Append(const std::vector<model::ProbeResult>& results) {
  if (results.empty()) return;

  // group by day, keeping batch order inside each partition
  std::map<std::string, std::vector<model::ProbeResult>> by_day;
  for (const auto& result : results) {
    by_day[util::DayKey(result.timestamp)].push_back(result);
  }

  std::unique_lock lock(mutex_);

  std::vector<PendingWrite> writes;
  writes.reserve(by_day.size());
  for (const auto& [day, rows] : by_day) {
    PendingWrite write;
    write.path = PartitionPath(day);

    std::error_code ec;
    if (std::filesystem::exists(write.path, ec)) {
      write.existed       = true;
      write.previous_size = std::filesystem::file_size(write.path, ec);
      if (ec) {
        throw util::StoreError("stat " + write.path.string() + ": " + ec.message());
      }
    }
    write.data = EncodeResults(rows, /*include_header=*/write.previous_size == 0);
    writes.push_back(std::move(write));
  }

  for (std::size_t i = 0; i < writes.size(); ++i) {
    try {
      AppendFile(writes[i].path, writes[i].data);
    } catch (const std::exception& e) {
      RollBack(writes, i + 1);
      throw util::StoreError("append " + writes[i].path.string() + ": " + e.what());
    }
  }

  FLEETWATCH_LOG_DEBUG("Results appended", {observability::IntField("rows", static_cast<std::int64_t>(results.size())),
                                            observability::IntField("partitions", static_cast<std::int64_t>(writes.size()))});
}

std::vector<model::ProbeResult> ResultStore::ReadPartitionLocked(const std::string& day) const {
  const auto      path = PartitionPath(day);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return {};
  }

  auto decoded = DecodeResults(ReadFile(path));
  if (decoded.malformed > 0) {
    FLEETWATCH_LOG_WARN("Skipped malformed result rows", {observability::StringField("partition", path.filename().string()),
                                                          observability::IntField("rows", static_cast<std::int64_t>(decoded.malformed))});
  }
  return std::move(decoded.results);
}

std::vector<model::ProbeResult> ResultStore::ReadPartition(const std::string& day) const {
  if (!util::ParseDayKey(day)) {
    throw util::InvalidArgument("partition date must be YYYYMMDD: " + day);
  }
  std::shared_lock lock(mutex_);
  return ReadPartitionLocked(day);
}

std::vector<model::ProbeResult> ResultStore::Latest(std::size_t limit) const {
  std::vector<model::ProbeResult> out;
  if (limit == 0) return out;

  std::shared_lock lock(mutex_);
  for (const auto& partition : ListPartitionsLocked()) {
    auto rows = ReadPartitionLocked(partition.day);
    for (auto it = rows.rbegin(); it != rows.rend() && out.size() < limit; ++it) {
      out.push_back(std::move(*it));
    }
    if (out.size() >= limit) break;
  }
  return out;
}

std::vector<model::ProbeResult> ResultStore::ForDevice(const std::string& device_id, util::TimePoint since) const {
  if (device_id.empty()) {
    throw util::InvalidArgument("device_id is required");
  }

  const std::string first_day = util::DayKey(since);

  std::vector<model::ProbeResult> out;
  std::shared_lock                lock(mutex_);

  for (const auto& partition : ListPartitionsLocked()) {
    if (partition.day < first_day) break;
    auto rows = ReadPartitionLocked(partition.day);
    for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
      if (it->device_id == device_id && it->timestamp >= since) {
        out.push_back(std::move(*it));
      }
    }
  }
  return out;
}

std::vector<PartitionInfo> ResultStore::ListPartitionsLocked() const {
  std::vector<PartitionInfo> out;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(output_dir_, ec)) {
    if (!entry.is_regular_file()) continue;

    const auto  name = entry.path().filename().string();
    std::smatch match;
    if (!std::regex_match(name, match, PartitionPattern())) continue;

    PartitionInfo info;
    info.file_name  = name;
    info.day        = match[1].str();
    info.size_bytes = entry.file_size(ec);

    const auto mtime   = entry.last_write_time(ec);
    info.last_modified = std::chrono::time_point_cast<util::Clock::duration>(std::chrono::file_clock::to_sys(mtime));

    out.push_back(std::move(info));
  }
  if (ec) {
    throw util::StoreError("list " + output_dir_.string() + ": " + ec.message());
  }

  std::sort(out.begin(), out.end(), [](const PartitionInfo& a, const PartitionInfo& b) { return a.day > b.day; });
  return out;
}

std::vector<PartitionInfo> ResultStore::ListPartitions() const {
  std::shared_lock lock(mutex_);
  auto             partitions = ListPartitionsLocked();
  for (auto& partition : partitions) {
    partition.record_count = ReadPartitionLocked(partition.day).size();
  }
  return partitions;
}

RebuildReport ResultStore::Rebuild(const std::string& day) {
  if (!util::ParseDayKey(day)) {
    throw util::InvalidArgument("partition date must be YYYYMMDD: " + day);
  }

  std::unique_lock lock(mutex_);

  const auto      path = PartitionPath(day);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw util::NotFound("partition not found: " + day);
  }

  auto decoded = DecodeResults(ReadFile(path));
  std::stable_sort(decoded.results.begin(), decoded.results.end(),
                   [](const model::ProbeResult& a, const model::ProbeResult& b) { return a.timestamp < b.timestamp; });

  WriteFileAtomic(path, EncodeResults(decoded.results, /*include_header=*/true));

  RebuildReport report;
  report.kept    = decoded.results.size();
  report.dropped = decoded.malformed;

  for (auto& partition : ListPartitionsLocked()) {
    if (partition.day == day) {
      partition.record_count = report.kept;
      report.partition       = std::move(partition);
      break;
    }
  }

  FLEETWATCH_LOG_INFO("Partition rebuilt", {observability::StringField("partition", path.filename().string()),
                                            observability::IntField("kept", static_cast<std::int64_t>(report.kept)),
                                            observability::IntField("dropped", static_cast<std::int64_t>(report.dropped))});
  return report;
}

std::size_t ResultStore::PruneOlderThan(std::uint32_t days, util::TimePoint now) {
  if (days == 0) return 0;

  const std::string cutoff = util::DayKey(now - std::chrono::hours(24) * days);

  std::unique_lock lock(mutex_);
  std::size_t      removed = 0;
  for (const auto& partition : ListPartitionsLocked()) {
    if (partition.day >= cutoff) continue;
    std::error_code ec;
    if (std::filesystem::remove(PartitionPath(partition.day), ec)) {
      ++removed;
      FLEETWATCH_LOG_INFO("Result partition expired", {observability::StringField("partition", partition.file_name)});
    } else if (ec) {
      FLEETWATCH_LOG_WARN("Result partition removal failed",
                          {observability::StringField("partition", partition.file_name), observability::StringField("error", ec.message())});
    }
  }
  return removed;
}

} // namespace fleetwatch::store
