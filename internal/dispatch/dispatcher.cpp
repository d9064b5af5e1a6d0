#include "dispatcher.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace fleetwatch::dispatch {

using fleetwatch::observability::StringField;

Dispatcher::Dispatcher(std::shared_ptr<probe::Prober> prober, DispatchOptions options) : prober_(std::move(prober)), options_(options) {
  if (!prober_) {
    throw std::invalid_argument("dispatcher requires a prober");
  }
  if (options_.concurrency_limit == 0) {
    throw std::invalid_argument("dispatcher concurrency limit must be at least 1");
  }
  if (options_.probe_timeout.count() <= 0) {
    throw std::invalid_argument("dispatcher probe timeout must be positive");
  }

  workers_.reserve(options_.concurrency_limit);
  for (std::size_t i = 0; i < options_.concurrency_limit; ++i) {
    workers_.emplace_back(&Dispatcher::WorkerLoop, this);
  }
}

Dispatcher::~Dispatcher() {
  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

std::vector<model::ProbeResult> Dispatcher::Dispatch(const std::vector<model::Device>& devices) {
  if (devices.empty()) {
    return {};
  }

  auto batch = std::make_shared<PendingBatch>(devices.size());
  for (std::size_t i = 0; i < devices.size(); ++i) {
    queue_.Enqueue(ProbeTask{devices[i], i, batch});
  }

  batch->Wait();
  return std::move(batch->results);
}

model::ProbeResult Dispatcher::ProbeOne(const model::Device& device, std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    timeout = options_.probe_timeout;
  }
  return RunProbe(device, timeout);
}

void Dispatcher::WorkerLoop() {
  for (;;) {
    auto task = queue_.Dequeue();
    if (!task) break;

    task->batch->Complete(task->index, RunProbe(task->device, options_.probe_timeout));
  }
}

model::ProbeResult Dispatcher::RunProbe(const model::Device& device, std::chrono::milliseconds timeout) {
  probe::ProbeOutcome outcome;
  try {
    outcome = prober_->Probe(device.address, timeout);
  } catch (const std::exception& e) {
    FLEETWATCH_LOG_ERROR("Probe raised", {StringField("address", device.address), StringField("error", e.what())});
    outcome = probe::ProbeOutcome::Failed(probe::kReasonInternalError);
  } catch (...) {
    FLEETWATCH_LOG_ERROR("Probe raised non-standard exception", {StringField("address", device.address)});
    outcome = probe::ProbeOutcome::Failed(probe::kReasonInternalError);
  }

  model::ProbeResult result;
  result.timestamp = util::TruncateToMillis(util::Now());
  result.device_id = device.id;
  result.address   = device.address;
  result.hostname  = model::DisplayName(device);
  result.success   = outcome.success;
  if (outcome.success) {
    result.latency_ms = outcome.latency_ms;
  } else {
    result.error_message = outcome.reason.empty() ? std::string(probe::kReasonInternalError) : outcome.reason;
  }
  return result;
}

} // namespace fleetwatch::dispatch
