#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/model/probe_result.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::store {

struct PartitionInfo {
  std::string     file_name;
  std::string     day;  // YYYYMMDD
  std::uint64_t   size_bytes{0};
  std::uint64_t   record_count{0};
  util::TimePoint last_modified;
};

struct RebuildReport {
  std::size_t   kept{0};
  std::size_t   dropped{0};
  PartitionInfo partition;
};

/*
  Append-only probe history, one CSV file per local calendar day:

      <output_dir>/ping_results_YYYYMMDD.csv

  A batch is written with one write per partition. If any partition
  write fails, the partitions already touched by this batch are cut back
  to their previous length and StoreError is thrown, so a batch is either
  fully present or absent.

  Appends are exclusive; readers share the lock and never observe a
  partially written batch.
*/
class ResultStore {
 public:
  explicit ResultStore(std::filesystem::path output_dir);

  void Append(const std::vector<model::ProbeResult>& results);

  // Valid rows of one day in file order; empty when the file is absent.
  std::vector<model::ProbeResult> ReadPartition(const std::string& day) const;

  // Most recent rows first, across partitions.
  std::vector<model::ProbeResult> Latest(std::size_t limit) const;

  // Rows of one device at or after since, newest first.
  std::vector<model::ProbeResult> ForDevice(const std::string& device_id, util::TimePoint since) const;

  // Newest day first.
  std::vector<PartitionInfo> ListPartitions() const;

  // Rewrites a partition keeping only well-formed rows, ordered by timestamp.
  RebuildReport Rebuild(const std::string& day);

  // Deletes partitions older than days; 0 keeps everything. Returns files removed.
  std::size_t PruneOlderThan(std::uint32_t days, util::TimePoint now = util::Now());

  std::filesystem::path PartitionPath(const std::string& day) const;

  const std::filesystem::path& output_dir() const {
    return output_dir_;
  }

 private:
  std::vector<PartitionInfo> ListPartitionsLocked() const;
  std::vector<model::ProbeResult> ReadPartitionLocked(const std::string& day) const;

  std::filesystem::path     output_dir_;
  mutable std::shared_mutex mutex_;
};

} // namespace fleetwatch::store
