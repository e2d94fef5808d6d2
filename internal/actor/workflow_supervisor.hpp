#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/actor/workflow_actor.hpp"

namespace planner::actor {

/*
  WorkflowSupervisor

  Keeps one workflow actor alive. Exit notices arrive on the monitor
  thread; any exit other than a requested stop spawns a fresh actor from
  the stored ActorArgs and the same mailbox, so state comes back from the
  event log and queued commands are not lost.
*/
class WorkflowSupervisor {
 public:
  WorkflowSupervisor() = default;
  ~WorkflowSupervisor();

  WorkflowSupervisor(const WorkflowSupervisor&)            = delete;
  WorkflowSupervisor& operator=(const WorkflowSupervisor&) = delete;

  void Spawn(ActorArgs args);

  // Blocks until the actor replied. Rethrows the actor's error.
  v1::WorkflowView Execute(const v1::WorkflowCommand& command);
  v1::WorkflowView GetView();

  void Kill();
  void Stop();

  std::uint64_t RestartCount() const {
    return restarts_.load();
  }

  const ActorArgs& args() const {
    return args_;
  }

 private:
  void StartActor();
  void Monitor();
  void Post(ActorMessage message);

  ActorArgs                      args_;
  std::shared_ptr<Mailbox>       mailbox_ = std::make_shared<Mailbox>();
  std::unique_ptr<WorkflowActor> actor_;

  std::mutex              exit_mutex_;
  std::condition_variable exit_cv_;
  std::deque<ExitReason>  exits_;

  std::thread                monitor_;
  std::atomic<bool>          stopping_{false};
  std::atomic<std::uint64_t> restarts_{0};
};

} // namespace planner::actor
