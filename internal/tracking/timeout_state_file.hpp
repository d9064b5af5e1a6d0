#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/timeout_record.hpp"

namespace fleetwatch::tracking {

/*
  timeout_tracking.csv: the full set of failing addresses, rewritten after
  every tracker update and sorted by consecutive_timeouts, highest first.
*/

const std::vector<std::string>& StateColumns();

// Sorts a copy of records and replaces path atomically.
void SaveState(const std::filesystem::path& path, std::vector<model::TimeoutRecord> records);

// Missing file yields no records. Unparseable rows are skipped and counted in malformed.
std::vector<model::TimeoutRecord> LoadState(const std::filesystem::path& path, std::size_t* malformed = nullptr);

void SortByStreak(std::vector<model::TimeoutRecord>& records);

} // namespace fleetwatch::tracking
