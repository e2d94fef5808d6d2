#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/daemon/session_registry.hpp"

namespace planner::daemon {

/*
  Periodically downgrades sessions whose heartbeats went quiet.
*/
class LivenessSweeper {
 public:
  LivenessSweeper(std::shared_ptr<SessionRegistry> registry, std::chrono::milliseconds interval);
  ~LivenessSweeper();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<SessionRegistry> registry_;
  std::chrono::milliseconds        interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace planner::daemon
