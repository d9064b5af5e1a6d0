#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "internal/dispatch/probe_queue.hpp"
#include "internal/model/device.hpp"
#include "internal/model/probe_result.hpp"
#include "internal/probe/prober.hpp"

namespace fleetwatch::dispatch {

struct DispatchOptions {
  std::size_t               concurrency_limit{20};
  std::chrono::milliseconds probe_timeout{3000};
};

/*
  Worker pool dispatcher.

  A fixed set of concurrency_limit worker threads pulls probe tasks from
  a shared queue, so no more than concurrency_limit probes are ever in
  flight. Dispatch() blocks until every device has a result and returns
  them in input order, one per device.

  A probe that throws becomes a failed result ("internal error"); the
  rest of the batch is unaffected.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<probe::Prober> prober, DispatchOptions options);
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  std::vector<model::ProbeResult> Dispatch(const std::vector<model::Device>& devices);

  // Ad-hoc probe on the caller's thread, outside any cycle.
  model::ProbeResult ProbeOne(const model::Device& device, std::chrono::milliseconds timeout);

  const DispatchOptions& options() const {
    return options_;
  }

 private:
  void               WorkerLoop();
  model::ProbeResult RunProbe(const model::Device& device, std::chrono::milliseconds timeout);

  std::shared_ptr<probe::Prober> prober_;
  DispatchOptions                options_;
  ProbeQueue                     queue_;
  std::vector<std::thread>       workers_;
};

} // namespace fleetwatch::dispatch
