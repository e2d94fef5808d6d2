#include "liveness_sweeper.hpp"

#include "internal/observability/logging.hpp"

namespace planner::daemon {

LivenessSweeper::LivenessSweeper(std::shared_ptr<SessionRegistry> registry, std::chrono::milliseconds interval)
    : registry_(std::move(registry)), interval_(interval) {
}

LivenessSweeper::~LivenessSweeper() {
  Stop();
}

void LivenessSweeper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&LivenessSweeper::Loop, this);
}

void LivenessSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LivenessSweeper::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [&] { return !running_; })) {
      break;
    }

    lock.unlock();
    try {
      registry_->SweepAndNotify(util::Now());
    } catch (const std::exception& e) {
      PLANNER_LOG_ERROR("Liveness sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace planner::daemon
