#pragma once

#include <arrow/buffer.h>
#include <arrow/table.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/probe_result.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::store {

/*
  CSV file read back as text cells, in the requested column order.
  Rows whose field count does not match the header are skipped and
  counted. Columns absent from the file come back as empty strings.
*/
struct CsvTable {
  std::vector<std::vector<std::string>> rows;
  std::size_t                           skipped_rows{0};
};

CsvTable ParseCsv(const std::shared_ptr<arrow::Buffer>& data, const std::vector<std::string>& columns);

std::shared_ptr<arrow::Buffer> FormatCsv(const arrow::Table& table, bool include_header);

// ------------------------------------------------------------
// Result partition rows
// ------------------------------------------------------------

const std::vector<std::string>& ResultColumns();

std::shared_ptr<arrow::Buffer> EncodeResults(const std::vector<model::ProbeResult>& results, bool include_header);

struct DecodedResults {
  std::vector<model::ProbeResult> results;
  std::size_t                     malformed{0};
};

DecodedResults DecodeResults(const std::shared_ptr<arrow::Buffer>& data);

// nullopt when the row violates the record layout
std::optional<model::ProbeResult> DecodeResultRow(const std::vector<std::string>& row);

std::optional<bool>   ParseBool(const std::string& value);
std::optional<double> ParseDouble(const std::string& value);

} // namespace fleetwatch::store
