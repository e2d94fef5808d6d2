#include "workflow_actor.hpp"

#include <exception>
#include <utility>

#include "internal/domain/messages.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/view/workflow_view.hpp"

namespace planner::actor {

using observability::StringField;

const char* ExitReasonName(ExitReason reason) {
  switch (reason) {
    case ExitReason::kStopped:
      return "stopped";
    case ExitReason::kKilled:
      return "killed";
    case ExitReason::kFailed:
      return "failed";
  }
  return "failed";
}

WorkflowActor::WorkflowActor(ActorArgs args, std::shared_ptr<Mailbox> mailbox, ExitCallback on_exit)
    : args_(std::move(args)),
      mailbox_(std::move(mailbox)),
      on_exit_(std::move(on_exit)),
      store_(store::EventLogPath(args_.data_dir, args_.workflow_id), store::SnapshotPath(args_.data_dir, args_.workflow_id),
             args_.snapshot_every) {
}

WorkflowActor::~WorkflowActor() {
  Join();
}

void WorkflowActor::Start() {
  thread_ = std::thread(&WorkflowActor::Run, this);
}

void WorkflowActor::Join() {
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void WorkflowActor::Run() {
  ExitReason reason;
  try {
    reason = Loop();
  } catch (const std::exception& e) {
    PLANNER_LOG_ERROR("Workflow actor crashed", {StringField("workflow_id", args_.workflow_id), StringField("error", e.what())});
    reason = ExitReason::kFailed;
  }

  PLANNER_LOG_DEBUG("Workflow actor exited", {StringField("workflow_id", args_.workflow_id), StringField("reason", ExitReasonName(reason))});
  if (on_exit_) {
    on_exit_(reason);
  }
}

ExitReason WorkflowActor::Loop() {
  view_ = view::BootstrapViewFromEvents(store_.log_path(), args_.workflow_id);
  args_.view->Publish(view_);

  while (auto message = mailbox_->Dequeue()) {
    if (auto* command = std::get_if<CommandMessage>(&*message)) {
      if (!HandleCommand(*command)) {
        return ExitReason::kFailed;
      }
    } else if (auto* get_view = std::get_if<GetViewMessage>(&*message)) {
      get_view->reply.set_value(view_);
    } else if (std::holds_alternative<KillMessage>(*message)) {
      return ExitReason::kKilled;
    } else {
      return ExitReason::kStopped;
    }
  }
  return ExitReason::kStopped;
}

store::AggregateContext& WorkflowActor::Context() {
  if (!context_) {
    context_ = store_.LoadAggregate(args_.workflow_id);
  }
  return *context_;
}

bool WorkflowActor::HandleCommand(CommandMessage& message) {
  const auto name = domain::CommandName(message.command);

  try {
    auto& context = Context();
    auto  events  = context.aggregate.Handle(message.command, util::Now());

    const auto base = context.current_sequence;
    store_.Commit(args_.workflow_id, &context, events, {{"command", name}});

    for (std::size_t i = 0; i < events.size(); ++i) {
      const auto sequence = base + i + 1;
      view::ApplyToView(&view_, args_.workflow_id, events[i], sequence);

      v1::WorkflowEventEnvelope envelope;
      envelope.set_aggregate_id(args_.workflow_id);
      envelope.set_sequence(sequence);
      envelope.set_event_type(domain::EventType(events[i]));
      *envelope.mutable_event() = events[i];
      args_.events->Publish(envelope);
    }
    args_.view->Publish(view_);

    observability::Metrics::Instance().RecordCommand(name, true);
    message.reply.set_value(view_);
    return true;
  } catch (const util::WorkflowError& e) {
    observability::Metrics::Instance().RecordCommand(name, false);

    // cached state may be behind the log; rebuild on next command
    if (dynamic_cast<const util::ConcurrencyConflict*>(&e) || dynamic_cast<const util::StorageFailure*>(&e)) {
      PLANNER_LOG_WARN("Dropping cached aggregate", {StringField("workflow_id", args_.workflow_id), StringField("error", e.what())});
      context_.reset();
      view_ = view::BootstrapViewFromEvents(store_.log_path(), args_.workflow_id);
      args_.view->Publish(view_);
    }
    message.reply.set_exception(std::current_exception());
    return true;
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordCommand(name, false);
    PLANNER_LOG_ERROR("Command failed unexpectedly",
                      {StringField("workflow_id", args_.workflow_id), StringField("command", name), StringField("error", e.what())});
    message.reply.set_exception(std::current_exception());
    return false;
  }
}

} // namespace planner::actor
