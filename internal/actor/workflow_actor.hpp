#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/actor/mailbox.hpp"
#include "internal/store/file_event_store.hpp"
#include "internal/view/broadcast.hpp"
#include "internal/view/latest_value.hpp"
#include "planner/v1/events.pb.h"
#include "planner/v1/state.pb.h"

namespace planner::actor {

using ViewSlot    = view::LatestValue<v1::WorkflowView>;
using EventStream = view::Broadcast<v1::WorkflowEventEnvelope>;

// Everything needed to (re)build an actor from scratch.
struct ActorArgs {
  std::string                  workflow_id;
  std::filesystem::path        data_dir;
  std::uint32_t                snapshot_every = 50;
  std::shared_ptr<ViewSlot>    view;
  std::shared_ptr<EventStream> events;
};

enum class ExitReason { kStopped, kKilled, kFailed };

const char* ExitReasonName(ExitReason reason);

/*
  WorkflowActor

  Owns one workflow's aggregate and view on a dedicated thread and
  processes its mailbox strictly in order:

      load → Handle → Commit → view/broadcast → reply

  Workflow errors go back to the caller and the actor keeps running.
  Anything else is reported to the caller and ends the actor with
  ExitReason::kFailed.
*/
class WorkflowActor {
 public:
  using ExitCallback = std::function<void(ExitReason)>;

  WorkflowActor(ActorArgs args, std::shared_ptr<Mailbox> mailbox, ExitCallback on_exit);
  ~WorkflowActor();

  WorkflowActor(const WorkflowActor&)            = delete;
  WorkflowActor& operator=(const WorkflowActor&) = delete;

  void Start();
  void Join();

 private:
  void       Run();
  ExitReason Loop();
  bool       HandleCommand(CommandMessage& message);

  store::AggregateContext& Context();

  ActorArgs                args_;
  std::shared_ptr<Mailbox> mailbox_;
  ExitCallback             on_exit_;
  store::FileEventStore    store_;

  std::optional<store::AggregateContext> context_;
  v1::WorkflowView                       view_;

  std::thread thread_;
};

} // namespace planner::actor
