#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/notify/alert_message.hpp"

namespace fleetwatch::notify {

/*
  Blocking queue between the timeout tracker and its delivery thread.

  The consumer calls Done() after each event it dequeued so WaitIdle()
  can tell when everything enqueued so far has been handled.
*/
class AlertQueue {
 public:
  void Enqueue(AlertEvent event);

  // blocking wait; nullopt once shut down
  std::optional<AlertEvent> Dequeue();

  void Done();

  void WaitIdle();

  // Wakes the consumer and discards events not yet dequeued. Returns how many were dropped.
  std::size_t Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_;
  std::queue<AlertEvent>  queue_;
  std::size_t             in_progress_ = 0;
  bool                    shutdown_    = false;
};

} // namespace fleetwatch::notify
