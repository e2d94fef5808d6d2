#pragma once

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <variant>

#include "planner/v1/commands.pb.h"
#include "planner/v1/state.pb.h"

namespace planner::actor {

struct CommandMessage {
  v1::WorkflowCommand            command;
  std::promise<v1::WorkflowView> reply;
};

struct GetViewMessage {
  std::promise<v1::WorkflowView> reply;
};

// Orderly exit; the supervisor does not respawn.
struct StopMessage {};

// Abnormal exit; the supervisor respawns.
struct KillMessage {};

using ActorMessage = std::variant<CommandMessage, GetViewMessage, StopMessage, KillMessage>;

/*
  FIFO blocking queue feeding one workflow actor.

  Owned by the supervisor and handed to every actor incarnation, so
  messages queued behind a crash are picked up by the replacement.
*/
class Mailbox {
 public:
  // false once closed
  bool Enqueue(ActorMessage message) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return false;
      queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait; nullopt once closed and drained
  std::optional<ActorMessage> Dequeue() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) return std::nullopt;

    ActorMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
  }

  // Closes the mailbox and hands back whatever was still queued.
  std::deque<ActorMessage> Close() {
    std::deque<ActorMessage> pending;
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      pending.swap(queue_);
    }
    cv_.notify_all();
    return pending;
  }

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::deque<ActorMessage> queue_;
  bool                     closed_ = false;
};

} // namespace planner::actor
