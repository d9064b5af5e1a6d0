#include "internal/dispatch/dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using fleetwatch::dispatch::DispatchOptions;
using fleetwatch::dispatch::Dispatcher;
using fleetwatch::model::Device;
using fleetwatch::probe::ProbeOutcome;

// Sleeps for a fixed delay and tracks how many probes overlap.
class FakeProber final : public fleetwatch::probe::Prober {
 public:
  explicit FakeProber(std::chrono::milliseconds delay) : delay_(delay) {
  }

  ProbeOutcome Probe(const std::string& address, std::chrono::milliseconds timeout) override {
    last_timeout_ms_.store(timeout.count());
    const int now_in_flight = in_flight_.fetch_add(1) + 1;
    int       seen          = max_in_flight_.load();
    while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
    }

    std::this_thread::sleep_for(delay_);
    in_flight_.fetch_sub(1);
    calls_.fetch_add(1);

    if (address == "10.0.0.66") {
      throw std::runtime_error("socket exhausted");
    }
    if (address.rfind("10.0.1.", 0) == 0) {
      return ProbeOutcome::Failed(fleetwatch::probe::kReasonTimeout);
    }
    return ProbeOutcome::Reachable(1.25);
  }

  int max_in_flight() const {
    return max_in_flight_.load();
  }

  int calls() const {
    return calls_.load();
  }

  long long last_timeout_ms() const {
    return last_timeout_ms_.load();
  }

 private:
  std::chrono::milliseconds delay_;
  std::atomic<int>          in_flight_{0};
  std::atomic<int>          max_in_flight_{0};
  std::atomic<int>          calls_{0};
  std::atomic<long long>    last_timeout_ms_{0};
};

std::vector<Device> MakeDevices(int count, const std::string& prefix = "10.0.0.") {
  std::vector<Device> devices;
  for (int i = 1; i <= count; ++i) {
    Device device;
    device.id       = std::to_string(i);
    device.address  = prefix + std::to_string(i);
    device.hostname = "host-" + std::to_string(i);
    devices.push_back(device);
  }
  return devices;
}

void TestResultsKeepInputOrder() {
  auto       prober = std::make_shared<FakeProber>(5ms);
  Dispatcher dispatcher(prober, DispatchOptions{4, 500ms});

  const auto devices = MakeDevices(25);
  const auto results = dispatcher.Dispatch(devices);

  assert(results.size() == devices.size());
  for (std::size_t i = 0; i < devices.size(); ++i) {
    assert(results[i].device_id == devices[i].id);
    assert(results[i].address == devices[i].address);
    assert(results[i].hostname == devices[i].hostname);
    assert(results[i].success);
    assert(results[i].latency_ms.has_value());
    assert(!results[i].error_message.has_value());
  }
}

void TestConcurrencyLimitIsHonored() {
  auto       prober = std::make_shared<FakeProber>(20ms);
  Dispatcher dispatcher(prober, DispatchOptions{3, 500ms});

  const auto results = dispatcher.Dispatch(MakeDevices(12));
  assert(results.size() == 12);
  assert(prober->calls() == 12);
  assert(prober->max_in_flight() <= 3);
  assert(prober->max_in_flight() >= 2);
}

void TestBatchTimeIsBoundedByWaves() {
  // 10 devices, 5 workers, 100ms each: two waves.
  auto       prober = std::make_shared<FakeProber>(100ms);
  Dispatcher dispatcher(prober, DispatchOptions{5, 100ms});

  const auto start   = std::chrono::steady_clock::now();
  const auto results = dispatcher.Dispatch(MakeDevices(10));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  assert(results.size() == 10);
  assert(elapsed >= 190ms);
  assert(elapsed < 900ms);
}

void TestFailuresStayPerDevice() {
  auto       prober  = std::make_shared<FakeProber>(1ms);
  Dispatcher dispatcher(prober, DispatchOptions{2, 200ms});

  auto devices = MakeDevices(3);
  devices[1].address = "10.0.0.66";
  auto failing       = MakeDevices(1, "10.0.1.");
  devices.push_back(failing.front());

  const auto results = dispatcher.Dispatch(devices);
  assert(results.size() == 4);
  assert(results[0].success);
  assert(!results[1].success);
  assert(results[1].error_message == std::string(fleetwatch::probe::kReasonInternalError));
  assert(!results[1].latency_ms.has_value());
  assert(results[2].success);
  assert(!results[3].success);
  assert(results[3].error_message == std::string(fleetwatch::probe::kReasonTimeout));
}

void TestEmptyBatch() {
  auto       prober = std::make_shared<FakeProber>(1ms);
  Dispatcher dispatcher(prober, DispatchOptions{2, 200ms});

  assert(dispatcher.Dispatch({}).empty());
  assert(prober->calls() == 0);
}

void TestHostnameFallsBackToAddress() {
  auto       prober = std::make_shared<FakeProber>(1ms);
  Dispatcher dispatcher(prober, DispatchOptions{1, 200ms});

  Device device;
  device.id      = "9";
  device.address = "10.0.0.9";

  const auto results = dispatcher.Dispatch({device});
  assert(results.size() == 1);
  assert(results[0].hostname == "10.0.0.9");
}

void TestProbeOneUsesDefaultTimeout() {
  auto       prober = std::make_shared<FakeProber>(1ms);
  Dispatcher dispatcher(prober, DispatchOptions{1, 750ms});

  const auto device = MakeDevices(1).front();

  const auto first = dispatcher.ProbeOne(device, 0ms);
  assert(first.success);
  assert(prober->last_timeout_ms() == 750);

  const auto second = dispatcher.ProbeOne(device, 40ms);
  assert(second.success);
  assert(prober->last_timeout_ms() == 40);
}

void TestRejectsInvalidOptions() {
  auto prober = std::make_shared<FakeProber>(1ms);

  bool threw = false;
  try {
    Dispatcher dispatcher(prober, DispatchOptions{0, 100ms});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Dispatcher dispatcher(prober, DispatchOptions{2, 0ms});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Dispatcher dispatcher(nullptr, DispatchOptions{2, 100ms});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentBatchesAreIndependent() {
  auto       prober = std::make_shared<FakeProber>(2ms);
  Dispatcher dispatcher(prober, DispatchOptions{4, 200ms});

  std::vector<std::size_t> sizes(2);
  std::thread              a([&] { sizes[0] = dispatcher.Dispatch(MakeDevices(7)).size(); });
  std::thread              b([&] { sizes[1] = dispatcher.Dispatch(MakeDevices(9, "10.0.2.")).size(); });
  a.join();
  b.join();

  assert(sizes[0] == 7);
  assert(sizes[1] == 9);
  assert(prober->max_in_flight() <= 4);
}

} // namespace

int main() {
  TestResultsKeepInputOrder();
  TestConcurrencyLimitIsHonored();
  TestBatchTimeIsBoundedByWaves();
  TestFailuresStayPerDevice();
  TestEmptyBatch();
  TestHostnameFallsBackToAddress();
  TestProbeOneUsesDefaultTimeout();
  TestRejectsInvalidOptions();
  TestConcurrentBatchesAreIndependent();

  std::cout << "fleetwatch_unit_dispatcher: pass\n";
  return 0;
}
