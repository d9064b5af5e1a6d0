#include "internal/store/result_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using fleetwatch::model::ProbeResult;
using fleetwatch::store::ResultStore;
using fleetwatch::util::TimePoint;

std::filesystem::path MakeTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fleetwatch_result_store_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

TimePoint At(const std::string& text) {
  auto tp = fleetwatch::util::ParseLocal(text);
  assert(tp.has_value());
  return *tp;
}

ProbeResult Success(const std::string& id, TimePoint at, double latency) {
  ProbeResult result;
  result.timestamp  = at;
  result.device_id  = id;
  result.address    = "10.0.0." + id;
  result.hostname   = "host-" + id;
  result.success    = true;
  result.latency_ms = latency;
  return result;
}

ProbeResult Failure(const std::string& id, TimePoint at, const std::string& reason = "timeout") {
  ProbeResult result;
  result.timestamp     = at;
  result.device_id     = id;
  result.address       = "10.0.0." + id;
  result.hostname      = "host-" + id;
  result.success       = false;
  result.error_message = reason;
  return result;
}

std::string ReadText(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::size_t CountLines(const std::string& text) {
  std::size_t lines = 0;
  for (char c : text) {
    if (c == '\n') ++lines;
  }
  return lines;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestAppendAndReadBack() {
  const auto  dir = MakeTempDir("roundtrip");
  ResultStore store(dir);
  assert(std::filesystem::is_directory(dir));
  // no file until the first append
  assert(store.ListPartitions().empty());

  const auto t0 = At("2024-05-01T10:00:00.125");
  store.Append({Success("1", t0, 1.5), Failure("2", t0 + 1ms, "unreachable"), Success("3", t0 + 2ms, 0.0)});
  store.Append({Failure("1", t0 + 5s)});

  const auto path = store.PartitionPath("20240501");
  assert(path.filename() == "ping_results_20240501.csv");
  const auto text = ReadText(path);
  assert(text.rfind("timestamp,device_id,address,hostname,success,latency_ms,error_message", 0) == 0 ||
         text.rfind("\"timestamp\",\"device_id\",\"address\",\"hostname\",\"success\",\"latency_ms\",\"error_message\"", 0) == 0);
  // one header, four rows
  assert(CountLines(text) == 5);

  const auto rows = store.ReadPartition("20240501");
  assert(rows.size() == 4);
  assert(rows[0].device_id == "1" && rows[0].success && *rows[0].latency_ms == 1.5);
  assert(rows[0].timestamp == t0);
  assert(rows[1].device_id == "2" && !rows[1].success && *rows[1].error_message == "unreachable");
  assert(!rows[1].latency_ms.has_value());
  assert(rows[2].success && *rows[2].latency_ms == 0.0);
  assert(rows[3].timestamp == t0 + 5s);

  assert(store.ReadPartition("20240502").empty());
}

void TestRowsLandInTheirLocalDay() {
  const auto  dir = MakeTempDir("partitioning");
  ResultStore store(dir);

  const auto late  = At("2024-05-01T23:59:59.900");
  const auto early = At("2024-05-02T00:00:00.100");
  store.Append({Success("1", late, 3.0), Success("1", early, 4.0)});

  const auto partitions = store.ListPartitions();
  assert(partitions.size() == 2);
  assert(partitions[0].day == "20240502");
  assert(partitions[0].record_count == 1);
  assert(partitions[1].day == "20240501");
  assert(partitions[1].file_name == "ping_results_20240501.csv");
  assert(partitions[1].size_bytes > 0);

  assert(store.ReadPartition("20240501").front().timestamp == late);
  assert(store.ReadPartition("20240502").front().timestamp == early);
}

void TestLatestAndDeviceHistory() {
  const auto  dir = MakeTempDir("queries");
  ResultStore store(dir);

  const auto d1 = At("2024-05-01T12:00:00.000");
  const auto d2 = At("2024-05-02T12:00:00.000");
  store.Append({Success("1", d1, 1.0), Success("2", d1 + 1s, 2.0)});
  store.Append({Failure("1", d2), Success("2", d2 + 1s, 2.5), Success("1", d2 + 2s, 1.1)});

  const auto latest = store.Latest(4);
  assert(latest.size() == 4);
  assert(latest[0].timestamp == d2 + 2s);
  assert(latest[1].timestamp == d2 + 1s);
  assert(latest[2].timestamp == d2);
  assert(latest[3].timestamp == d1 + 1s);
  assert(store.Latest(0).empty());
  assert(store.Latest(100).size() == 5);

  const auto all = store.ForDevice("1", d1 - 1h);
  assert(all.size() == 3);
  assert(all[0].timestamp == d2 + 2s);
  assert(all[2].timestamp == d1);

  const auto recent = store.ForDevice("1", d2 + 1s);
  assert(recent.size() == 1);
  assert(recent[0].success);

  assert(store.ForDevice("99", d1).empty());
  assert(Throws<fleetwatch::util::InvalidArgument>([&] { store.ForDevice("", d1); }));
}

void TestFailedBatchLeavesNoRows() {
  const auto  dir = MakeTempDir("atomic");
  ResultStore store(dir);

  const auto d1 = At("2024-05-01T12:00:00.000");
  const auto d2 = At("2024-05-02T12:00:00.000");
  store.Append({Success("1", d1, 1.0)});
  const auto before = std::filesystem::file_size(store.PartitionPath("20240501"));

  // the second day's partition cannot be written
  std::filesystem::create_directories(store.PartitionPath("20240502"));

  assert(Throws<fleetwatch::util::StoreError>([&] { store.Append({Success("2", d1 + 1s, 2.0), Success("2", d2, 2.0)}); }));
  assert(std::filesystem::file_size(store.PartitionPath("20240501")) == before);
  assert(store.ReadPartition("20240501").size() == 1);
}

void TestRebuildDropsMalformedRows() {
  const auto  dir = MakeTempDir("rebuild");
  ResultStore store(dir);

  const auto t0 = At("2024-05-03T08:00:00.000");
  store.Append({Success("2", t0 + 10s, 2.0), Success("1", t0, 1.0)});
  {
    std::ofstream out(store.PartitionPath("20240503"), std::ios::app);
    out << "garbage\n";
    out << "2024-05-03T08:00:05.000,3,10.0.0.3,host-3,maybe,,\n";
    out << "2024-05-03T08:00:06.000,4,10.0.0.4,host-4,false,,\n";
  }
  store.Append({Failure("5", t0 + 5s)});

  assert(store.ReadPartition("20240503").size() == 3);

  const auto report = store.Rebuild("20240503");
  assert(report.kept == 3);
  assert(report.dropped == 3);
  assert(report.partition.day == "20240503");
  assert(report.partition.record_count == 3);

  const auto rows = store.ReadPartition("20240503");
  assert(rows.size() == 3);
  assert(rows[0].device_id == "1");
  assert(rows[1].device_id == "5");
  assert(rows[2].device_id == "2");
  assert(CountLines(ReadText(store.PartitionPath("20240503"))) == 4);

  assert(Throws<fleetwatch::util::NotFound>([&] { store.Rebuild("20240504"); }));
  assert(Throws<fleetwatch::util::InvalidArgument>([&] { store.Rebuild("2024-05-03"); }));
  assert(Throws<fleetwatch::util::InvalidArgument>([&] { store.ReadPartition("yesterday"); }));
}

void TestPruneRemovesOldPartitions() {
  const auto  dir = MakeTempDir("prune");
  ResultStore store(dir);

  for (int day = 1; day <= 9; ++day) {
    const std::string text = "2024-05-0" + std::to_string(day) + "T12:00:00.000";
    store.Append({Success("1", At(text), 1.0)});
  }
  // unrelated files are left alone
  std::ofstream(dir / "notes.txt") << "keep";

  const auto now = At("2024-05-10T12:00:00.000");
  assert(store.PruneOlderThan(0, now) == 0);
  assert(store.ListPartitions().size() == 9);

  assert(store.PruneOlderThan(3, now) == 6);
  const auto left = store.ListPartitions();
  assert(left.size() == 3);
  assert(left.back().day == "20240507");
  assert(std::filesystem::exists(dir / "notes.txt"));
}

} // namespace

// Readers running during appends only ever see whole batches.
void TestReadersNeverSeePartialBatches() {
  const auto  dir = MakeTempDir("concurrent");
  ResultStore store(dir);

  constexpr std::size_t kBatchSize = 5;
  constexpr int         kBatches   = 150;
  const auto            base       = At("2024-06-01T10:00:00.000");

  std::atomic<bool> done{false};
  std::atomic<int>  violations{0};
  std::atomic<int>  reads{0};

  auto reader = [&] {
    while (!done.load()) {
      if (store.Latest(100000).size() % kBatchSize != 0) ++violations;
      for (const auto& partition : store.ListPartitions()) {
        if (partition.record_count % kBatchSize != 0) ++violations;
      }
      ++reads;
    }
  };

  std::vector<std::thread> readers;
  for (int i = 0; i < 2; ++i) readers.emplace_back(reader);

  for (int n = 0; n < kBatches; ++n) {
    std::vector<ProbeResult> batch;
    for (std::size_t i = 0; i < kBatchSize; ++i) {
      const auto at = base + n * 1s + std::chrono::milliseconds(i);
      batch.push_back(i % 2 == 0 ? Success(std::to_string(i + 1), at, 1.5) : Failure(std::to_string(i + 1), at));
    }
    store.Append(batch);
  }

  done = true;
  for (auto& thread : readers) thread.join();

  assert(violations == 0);
  assert(reads > 0);
  assert(store.ReadPartition("20240601").size() == kBatchSize * kBatches);
}

int main() {
  TestAppendAndReadBack();
  TestRowsLandInTheirLocalDay();
  TestLatestAndDeviceHistory();
  TestFailedBatchLeavesNoRows();
  TestRebuildDropsMalformedRows();
  TestPruneRemovesOldPartitions();
  TestReadersNeverSeePartialBatches();

  std::cout << "fleetwatch_unit_result_store: pass\n";
  return 0;
}
