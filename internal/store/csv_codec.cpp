#include "csv_codec.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/csv/api.h>
#include <arrow/io/memory.h>
#include <arrow/type.h>

#include <cmath>
#include <cstdlib>

#include "internal/store/arrow_io.hpp"

namespace fleetwatch::store {

namespace {

enum ResultColumn : std::size_t {
  kTimestamp = 0,
  kDeviceId,
  kAddress,
  kHostname,
  kSuccess,
  kLatencyMs,
  kErrorMessage,
};

} // namespace

CsvTable ParseCsv(const std::shared_ptr<arrow::Buffer>& data, const std::vector<std::string>& columns) {
  CsvTable out;
  if (!data || data->size() == 0) {
    return out;
  }

  auto read_options        = arrow::csv::ReadOptions::Defaults();
  read_options.use_threads = false;

  std::size_t skipped                = 0;
  auto        parse_options          = arrow::csv::ParseOptions::Defaults();
  parse_options.newlines_in_values   = true;
  parse_options.invalid_row_handler  = [&skipped](const arrow::csv::InvalidRow&) {
    ++skipped;
    return arrow::csv::InvalidRowResult::Skip;
  };

  auto convert_options                    = arrow::csv::ConvertOptions::Defaults();
  convert_options.include_columns         = columns;
  convert_options.include_missing_columns = true;
  convert_options.strings_can_be_null     = false;
  for (const auto& column : columns) {
    convert_options.column_types[column] = arrow::utf8();
  }

  auto input  = std::make_shared<arrow::io::BufferReader>(data);
  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options));
  auto table  = Unwrap(reader->Read());

  out.skipped_rows = skipped;
  out.rows.assign(static_cast<std::size_t>(table->num_rows()), std::vector<std::string>(columns.size()));

  for (std::size_t c = 0; c < columns.size(); ++c) {
    auto    chunked = table->GetColumnByName(columns[c]);
    int64_t row     = 0;
    if (!chunked) continue;
    for (const auto& chunk : chunked->chunks()) {
      if (chunk->type_id() != arrow::Type::STRING) {
        row += chunk->length();
        continue;
      }
      auto strings = std::static_pointer_cast<arrow::StringArray>(chunk);
      for (int64_t i = 0; i < strings->length(); ++i, ++row) {
        if (!strings->IsNull(i)) {
          out.rows[static_cast<std::size_t>(row)][c] = strings->GetString(i);
        }
      }
    }
  }

  return out;
}

std::shared_ptr<arrow::Buffer> FormatCsv(const arrow::Table& table, bool include_header) {
  auto sink               = Unwrap(arrow::io::BufferOutputStream::Create());
  auto options            = arrow::csv::WriteOptions::Defaults();
  options.include_header  = include_header;
  Unwrap(arrow::csv::WriteCSV(table, options, sink.get()));
  return Unwrap(sink->Finish());
}

const std::vector<std::string>& ResultColumns() {
  static const std::vector<std::string> kColumns = {"timestamp", "device_id", "address", "hostname", "success", "latency_ms", "error_message"};
  return kColumns;
}

std::shared_ptr<arrow::Buffer> EncodeResults(const std::vector<model::ProbeResult>& results, bool include_header) {
  arrow::StringBuilder  timestamp, device_id, address, hostname, error_message;
  arrow::BooleanBuilder success;
  arrow::DoubleBuilder  latency_ms;

  for (const auto& result : results) {
    Unwrap(timestamp.Append(util::FormatLocal(result.timestamp)));
    Unwrap(device_id.Append(result.device_id));
    Unwrap(address.Append(result.address));
    Unwrap(hostname.Append(result.hostname));
    Unwrap(success.Append(result.success));
    if (result.latency_ms) {
      Unwrap(latency_ms.Append(*result.latency_ms));
    } else {
      Unwrap(latency_ms.AppendNull());
    }
    if (result.error_message) {
      Unwrap(error_message.Append(*result.error_message));
    } else {
      Unwrap(error_message.AppendNull());
    }
  }

  const auto& names  = ResultColumns();
  auto        schema = arrow::schema({
      arrow::field(names[kTimestamp], arrow::utf8()),
      arrow::field(names[kDeviceId], arrow::utf8()),
      arrow::field(names[kAddress], arrow::utf8()),
      arrow::field(names[kHostname], arrow::utf8()),
      arrow::field(names[kSuccess], arrow::boolean()),
      arrow::field(names[kLatencyMs], arrow::float64()),
      arrow::field(names[kErrorMessage], arrow::utf8()),
  });

  auto table = arrow::Table::Make(schema, {
                                              Unwrap(timestamp.Finish()),
                                              Unwrap(device_id.Finish()),
                                              Unwrap(address.Finish()),
                                              Unwrap(hostname.Finish()),
                                              Unwrap(success.Finish()),
                                              Unwrap(latency_ms.Finish()),
                                              Unwrap(error_message.Finish()),
                                          });
  return FormatCsv(*table, include_header);
}

std::optional<bool> ParseBool(const std::string& value) {
  if (value == "true" || value == "True" || value == "1") return true;
  if (value == "false" || value == "False" || value == "0") return false;
  return std::nullopt;
}

std::optional<double> ParseDouble(const std::string& value) {
  if (value.empty()) return std::nullopt;
  char*        end    = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(parsed)) return std::nullopt;
  return parsed;
}

std::optional<model::ProbeResult> DecodeResultRow(const std::vector<std::string>& row) {
  if (row.size() < ResultColumns().size()) return std::nullopt;

  auto timestamp = util::ParseLocal(row[kTimestamp]);
  auto success   = ParseBool(row[kSuccess]);
  if (!timestamp || !success || row[kAddress].empty()) return std::nullopt;

  model::ProbeResult result;
  result.timestamp = *timestamp;
  result.device_id = row[kDeviceId];
  result.address   = row[kAddress];
  result.hostname  = row[kHostname];
  result.success   = *success;

  if (result.success) {
    auto latency = ParseDouble(row[kLatencyMs]);
    if (!latency || *latency < 0.0) return std::nullopt;
    result.latency_ms = *latency;
  } else {
    if (row[kErrorMessage].empty()) return std::nullopt;
    result.error_message = row[kErrorMessage];
  }
  return result;
}

DecodedResults DecodeResults(const std::shared_ptr<arrow::Buffer>& data) {
  DecodedResults out;
  auto           table = ParseCsv(data, ResultColumns());
  out.malformed        = table.skipped_rows;
  out.results.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    if (auto result = DecodeResultRow(row)) {
      out.results.push_back(std::move(*result));
    } else {
      ++out.malformed;
    }
  }
  return out;
}

} // namespace fleetwatch::store
