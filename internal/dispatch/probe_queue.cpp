#include "probe_queue.hpp"

namespace fleetwatch::dispatch {

void PendingBatch::Complete(std::size_t index, model::ProbeResult result) {
  bool last = false;
  {
    std::lock_guard lock(mutex);
    results[index] = std::move(result);
    last           = --remaining == 0;
  }
  if (last) done.notify_all();
}

void PendingBatch::Wait() {
  std::unique_lock lock(mutex);
  done.wait(lock, [&] { return remaining == 0; });
}

void ProbeQueue::Enqueue(ProbeTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<ProbeTask> ProbeQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ProbeTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void ProbeQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace fleetwatch::dispatch
