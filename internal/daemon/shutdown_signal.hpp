#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace planner::daemon {

/*
  One-shot latch raised by the Shutdown and RequestUpgrade RPCs and
  awaited by the daemon's main loop.
*/
class ShutdownSignal {
 public:
  void Trigger() {
    {
      std::lock_guard lock(mutex_);
      triggered_ = true;
    }
    cv_.notify_all();
  }

  bool Triggered() const {
    std::lock_guard lock(mutex_);
    return triggered_;
  }

  // true once triggered
  bool WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return triggered_; });
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            triggered_ = false;
};

} // namespace planner::daemon
