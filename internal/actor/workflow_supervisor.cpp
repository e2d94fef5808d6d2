#include "workflow_supervisor.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace planner::actor {

using observability::IntField;
using observability::StringField;

namespace {

void FailPending(std::deque<ActorMessage> pending) {
  for (auto& message : pending) {
    auto error = std::make_exception_ptr(util::Internal("workflow actor stopped"));
    if (auto* command = std::get_if<CommandMessage>(&message)) {
      command->reply.set_exception(error);
    } else if (auto* get_view = std::get_if<GetViewMessage>(&message)) {
      get_view->reply.set_exception(error);
    }
  }
}

} // namespace

WorkflowSupervisor::~WorkflowSupervisor() {
  Stop();
}

void WorkflowSupervisor::Spawn(ActorArgs args) {
  if (monitor_.joinable()) {
    throw util::Internal("supervisor already spawned " + args_.workflow_id);
  }
  if (!args.view) args.view = std::make_shared<ViewSlot>();
  if (!args.events) args.events = std::make_shared<EventStream>(64);

  args_ = std::move(args);
  StartActor();
  monitor_ = std::thread(&WorkflowSupervisor::Monitor, this);
}

void WorkflowSupervisor::StartActor() {
  actor_ = std::make_unique<WorkflowActor>(args_, mailbox_, [this](ExitReason reason) {
    {
      std::lock_guard lock(exit_mutex_);
      exits_.push_back(reason);
    }
    exit_cv_.notify_one();
  });
  actor_->Start();
}

void WorkflowSupervisor::Monitor() {
  while (true) {
    ExitReason reason;
    {
      std::unique_lock lock(exit_mutex_);
      exit_cv_.wait(lock, [&] { return !exits_.empty(); });
      reason = exits_.front();
      exits_.pop_front();
    }

    actor_->Join();

    if (reason == ExitReason::kStopped || stopping_) {
      return;
    }

    restarts_++;
    observability::Metrics::Instance().RecordActorRestart();
    PLANNER_LOG_WARN("Restarting workflow actor",
                     {StringField("workflow_id", args_.workflow_id), StringField("reason", ExitReasonName(reason)),
                      IntField("restarts", static_cast<std::int64_t>(restarts_.load()))});
    StartActor();
  }
}

void WorkflowSupervisor::Post(ActorMessage message) {
  if (stopping_ || !mailbox_->Enqueue(std::move(message))) {
    throw util::Internal("workflow actor stopped");
  }
}

v1::WorkflowView WorkflowSupervisor::Execute(const v1::WorkflowCommand& command) {
  CommandMessage message;
  message.command = command;
  auto reply      = message.reply.get_future();
  Post(std::move(message));
  return reply.get();
}

v1::WorkflowView WorkflowSupervisor::GetView() {
  GetViewMessage message;
  auto           reply = message.reply.get_future();
  Post(std::move(message));
  return reply.get();
}

void WorkflowSupervisor::Kill() {
  Post(KillMessage{});
}

void WorkflowSupervisor::Stop() {
  if (stopping_.exchange(true)) {
    return;
  }
  mailbox_->Enqueue(StopMessage{});

  if (monitor_.joinable()) {
    monitor_.join();
  }
  actor_.reset();
  FailPending(mailbox_->Close());
}

} // namespace planner::actor
