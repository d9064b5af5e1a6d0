#include "timeout_state_file.hpp"

#include <arrow/builder.h>
#include <arrow/table.h>
#include <arrow/type.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>

#include "internal/store/arrow_io.hpp"
#include "internal/store/csv_codec.hpp"

namespace fleetwatch::tracking {

namespace {

using store::Unwrap;

enum StateColumn : std::size_t {
  kAddress = 0,
  kHostname,
  kDeviceId,
  kBrand,
  kOs,
  kCondition,
  kConsecutiveTimeouts,
  kFirstTimeout,
  kLastTimeout,
  kLastUpdated,
  kColumnCount,
};

std::optional<uint32_t> ParseCount(const std::string& value) {
  if (value.empty()) return std::nullopt;
  char*               end    = nullptr;
  const unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || parsed == 0 || parsed > UINT32_MAX) return std::nullopt;
  return static_cast<uint32_t>(parsed);
}

std::optional<model::TimeoutRecord> DecodeRow(const std::vector<std::string>& row) {
  if (row.size() < kColumnCount || row[kAddress].empty()) return std::nullopt;

  auto condition = model::ParseCondition(row[kCondition]);
  auto count     = ParseCount(row[kConsecutiveTimeouts]);
  auto first     = util::ParseLocal(row[kFirstTimeout]);
  auto last      = util::ParseLocal(row[kLastTimeout]);
  auto updated   = util::ParseLocal(row[kLastUpdated]);
  if (!condition || !count || !first || !last || !updated) return std::nullopt;

  model::TimeoutRecord record;
  record.address              = row[kAddress];
  record.hostname             = row[kHostname];
  record.device_id            = row[kDeviceId];
  record.brand                = row[kBrand];
  record.os                   = row[kOs];
  record.condition            = *condition;
  record.consecutive_timeouts = *count;
  record.first_timeout        = *first;
  record.last_timeout         = *last;
  record.last_updated         = *updated;
  return record;
}

} // namespace

const std::vector<std::string>& StateColumns() {
  static const std::vector<std::string> kColumns = {
      "address", "hostname", "device_id", "brand", "os", "condition", "consecutive_timeouts", "first_timeout", "last_timeout", "last_updated",
  };
  return kColumns;
}

void SortByStreak(std::vector<model::TimeoutRecord>& records) {
  std::sort(records.begin(), records.end(), [](const model::TimeoutRecord& a, const model::TimeoutRecord& b) {
    if (a.consecutive_timeouts != b.consecutive_timeouts) return a.consecutive_timeouts > b.consecutive_timeouts;
    return a.address < b.address;
  });
}

void SaveState(const std::filesystem::path& path, std::vector<model::TimeoutRecord> records) {
  SortByStreak(records);

  arrow::StringBuilder address, hostname, device_id, brand, os, condition, first_timeout, last_timeout, last_updated;
  arrow::UInt32Builder consecutive;

  for (const auto& record : records) {
    Unwrap(address.Append(record.address));
    Unwrap(hostname.Append(record.hostname));
    Unwrap(device_id.Append(record.device_id));
    Unwrap(brand.Append(record.brand));
    Unwrap(os.Append(record.os));
    Unwrap(condition.Append(std::string(model::ToString(record.condition))));
    Unwrap(consecutive.Append(record.consecutive_timeouts));
    Unwrap(first_timeout.Append(util::FormatLocal(record.first_timeout)));
    Unwrap(last_timeout.Append(util::FormatLocal(record.last_timeout)));
    Unwrap(last_updated.Append(util::FormatLocal(record.last_updated)));
  }

  const auto&                                names = StateColumns();
  std::vector<std::shared_ptr<arrow::Field>> fields;
  for (std::size_t i = 0; i < names.size(); ++i) {
    fields.push_back(arrow::field(names[i], i == kConsecutiveTimeouts ? arrow::uint32() : arrow::utf8()));
  }

  auto table = arrow::Table::Make(arrow::schema(fields), {
                                                             Unwrap(address.Finish()),
                                                             Unwrap(hostname.Finish()),
                                                             Unwrap(device_id.Finish()),
                                                             Unwrap(brand.Finish()),
                                                             Unwrap(os.Finish()),
                                                             Unwrap(condition.Finish()),
                                                             Unwrap(consecutive.Finish()),
                                                             Unwrap(first_timeout.Finish()),
                                                             Unwrap(last_timeout.Finish()),
                                                             Unwrap(last_updated.Finish()),
                                                         });

  store::WriteFileAtomic(path, store::FormatCsv(*table, /*include_header=*/true));
}

std::vector<model::TimeoutRecord> LoadState(const std::filesystem::path& path, std::size_t* malformed) {
  std::vector<model::TimeoutRecord> out;
  std::size_t                       bad = 0;

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto table = store::ParseCsv(store::ReadFile(path), StateColumns());
    bad        = table.skipped_rows;
    for (const auto& row : table.rows) {
      if (auto record = DecodeRow(row)) {
        out.push_back(std::move(*record));
      } else {
        ++bad;
      }
    }
  }

  if (malformed) *malformed = bad;
  return out;
}

} // namespace fleetwatch::tracking
