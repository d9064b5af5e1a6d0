#include "alert_queue.hpp"

namespace fleetwatch::notify {

void AlertQueue::Enqueue(AlertEvent event) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(std::move(event));
  }
  cv_.notify_one();
}

std::optional<AlertEvent> AlertQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  AlertEvent event = std::move(queue_.front());
  queue_.pop();
  ++in_progress_;
  return event;
}

void AlertQueue::Done() {
  bool idle = false;
  {
    std::lock_guard lock(mutex_);
    if (in_progress_ > 0) --in_progress_;
    idle = queue_.empty() && in_progress_ == 0;
  }
  if (idle) idle_.notify_all();
}

void AlertQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_.wait(lock, [&] { return shutdown_ || (queue_.empty() && in_progress_ == 0); });
}

std::size_t AlertQueue::Shutdown() {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    dropped   = queue_.size();
    std::queue<AlertEvent>().swap(queue_);
  }
  cv_.notify_all();
  idle_.notify_all();
  return dropped;
}

} // namespace fleetwatch::notify
