#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "internal/model/device.hpp"
#include "internal/model/probe_result.hpp"

namespace fleetwatch::dispatch {

/*
  Results of one Dispatch() call. Workers fill their slot and the
  dispatching thread waits until remaining reaches zero.
*/
struct PendingBatch {
  explicit PendingBatch(std::size_t size) : remaining(size), results(size) {
  }

  void Complete(std::size_t index, model::ProbeResult result);
  void Wait();

  std::mutex                      mutex;
  std::condition_variable         done;
  std::size_t                     remaining;
  std::vector<model::ProbeResult> results;
};

struct ProbeTask {
  model::Device                 device;
  std::size_t                   index{0};
  std::shared_ptr<PendingBatch> batch;
};

/*
  Thread-safe blocking queue feeding the probe workers.
*/
class ProbeQueue {
 public:
  void Enqueue(ProbeTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<ProbeTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<ProbeTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace fleetwatch::dispatch
