#include "internal/domain/workflow_aggregate.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/domain/failure.hpp"
#include "internal/domain/messages.hpp"
#include "internal/domain/types.hpp"
#include "internal/util/errors.hpp"

namespace {

using planner::domain::EventType;
using planner::domain::WorkflowAggregate;
using planner::v1::WorkflowCommand;
using planner::v1::WorkflowEvent;

// Handles and applies a command, keeping every produced event in `log`.
std::vector<WorkflowEvent> Run(WorkflowAggregate* aggregate, const WorkflowCommand& command, std::vector<WorkflowEvent>* log = nullptr) {
  auto events = aggregate->Handle(command, planner::util::Now());
  for (const auto& event : events) {
    aggregate->Apply(event);
    if (log) log->push_back(event);
  }
  return events;
}

WorkflowCommand Create(std::uint32_t max_iterations) {
  WorkflowCommand cmd;
  auto*           create = cmd.mutable_create_workflow();
  create->set_feature_name("auth-refactor");
  create->set_objective("split the auth module");
  create->set_working_dir("/tmp/work");
  create->set_plan_path("/tmp/work/plan.md");
  create->set_max_iterations(max_iterations);
  return cmd;
}

WorkflowCommand StartPlanning() {
  WorkflowCommand cmd;
  cmd.mutable_start_planning();
  return cmd;
}

WorkflowCommand PlanningCompleted() {
  WorkflowCommand cmd;
  cmd.mutable_planning_completed()->set_plan_path("/tmp/work/plan.md");
  return cmd;
}

WorkflowCommand CycleStarted(planner::v1::ReviewMode mode, const std::vector<std::string>& reviewers) {
  WorkflowCommand cmd;
  cmd.mutable_review_cycle_started()->set_mode(mode);
  for (const auto& r : reviewers) cmd.mutable_review_cycle_started()->add_reviewers(r);
  return cmd;
}

WorkflowCommand Approve(const std::string& reviewer) {
  WorkflowCommand cmd;
  cmd.mutable_reviewer_approved()->set_reviewer_id(reviewer);
  return cmd;
}

WorkflowCommand Reject(const std::string& reviewer) {
  WorkflowCommand cmd;
  cmd.mutable_reviewer_rejected()->set_reviewer_id(reviewer);
  cmd.mutable_reviewer_rejected()->set_feedback_path("/tmp/work/feedback_" + reviewer + ".md");
  return cmd;
}

WorkflowCommand CycleCompleted(bool approved) {
  WorkflowCommand cmd;
  cmd.mutable_review_cycle_completed()->set_approved(approved);
  return cmd;
}

WorkflowCommand RevisingStarted() {
  WorkflowCommand cmd;
  cmd.mutable_revising_started()->set_feedback_summary("tighten scope");
  return cmd;
}

WorkflowCommand RevisionCompleted() {
  WorkflowCommand cmd;
  cmd.mutable_revision_completed();
  return cmd;
}

// Runs one planning iteration from Reviewing that ends in a rejection.
void RejectedCycle(WorkflowAggregate* aggregate, std::vector<WorkflowEvent>* log) {
  Run(aggregate, CycleStarted(planner::v1::REVIEW_MODE_PARALLEL, {"claude"}), log);
  Run(aggregate, Reject("claude"), log);
  Run(aggregate, CycleCompleted(false), log);
}

void TestCreateWorkflowInitializes() {
  WorkflowAggregate aggregate;
  assert(!aggregate.Initialized());
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_UNINITIALIZED);

  auto events = Run(&aggregate, Create(0));
  assert(events.size() == 1);
  assert(EventType(events[0]) == "WorkflowCreated");
  assert(aggregate.Initialized());
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_PLANNING);
  assert(aggregate.Snapshot().data().iteration() == 1);
  assert(aggregate.Snapshot().data().max_iterations() == planner::domain::kDefaultMaxIterations);
}

void TestCommandBeforeCreateIsNotInitialized() {
  WorkflowAggregate aggregate;
  bool              threw = false;
  try {
    (void)aggregate.Handle(StartPlanning(), planner::util::Now());
  } catch (const planner::util::NotInitialized&) {
    threw = true;
  }
  assert(threw && "commands before CreateWorkflow must be rejected");
}

void TestStartPlanningIsIdempotent() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));

  auto first = Run(&aggregate, StartPlanning());
  assert(first.size() == 1);
  assert(EventType(first[0]) == "PlanningStarted");
  assert(aggregate.Snapshot().data().planning_started());
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_PLANNING);

  auto second = Run(&aggregate, StartPlanning());
  assert(second.empty());
}

void TestRejectedCommandLeavesStateUnchanged() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));
  Run(&aggregate, StartPlanning());

  const auto before = aggregate.Snapshot();
  bool       threw  = false;
  try {
    (void)aggregate.Handle(Approve("claude"), planner::util::Now());
  } catch (const planner::util::InvalidTransition& e) {
    threw = true;
    assert(std::string(e.what()).find("Planning") != std::string::npos);
  }
  assert(threw);
  assert(google::protobuf::util::MessageDifferencer::Equals(aggregate.Snapshot(), before));
}

void TestSequentialRejectionLeavesIterationUntilRevision() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));
  Run(&aggregate, StartPlanning());
  Run(&aggregate, PlanningCompleted());
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_REVIEWING);

  Run(&aggregate, CycleStarted(planner::v1::REVIEW_MODE_SEQUENTIAL, {"r1", "r2"}));

  // r2 is not up yet
  bool threw = false;
  try {
    (void)aggregate.Handle(Approve("r2"), planner::util::Now());
  } catch (const planner::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  Run(&aggregate, Reject("r1"));
  Run(&aggregate, Approve("r2"));
  auto events = Run(&aggregate, CycleCompleted(false));
  assert(events.size() == 1);

  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_REVISING);
  assert(aggregate.Snapshot().data().iteration() == 1);

  Run(&aggregate, RevisingStarted());
  Run(&aggregate, RevisionCompleted());
  assert(aggregate.Snapshot().data().iteration() == 2);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_REVIEWING);
}

void TestMaxIterationsExtendedPrecedesRevising() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));
  Run(&aggregate, StartPlanning());
  Run(&aggregate, PlanningCompleted());

  for (int i = 0; i < 2; ++i) {
    RejectedCycle(&aggregate, nullptr);
    assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_REVISING);
    Run(&aggregate, RevisingStarted());
    Run(&aggregate, RevisionCompleted());
  }
  assert(aggregate.Snapshot().data().iteration() == 3);

  RejectedCycle(&aggregate, nullptr);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION);
  assert(aggregate.Snapshot().data().decision_reason() == planner::v1::AWAITING_DECISION_REASON_MAX_ITERATIONS_REACHED);

  WorkflowCommand extend;
  extend.mutable_revising_started()->set_feedback_summary("one more pass");
  extend.mutable_revising_started()->set_additional_iterations(1);

  auto events = Run(&aggregate, extend);
  assert(events.size() == 2);
  assert(EventType(events[0]) == "MaxIterationsExtended");
  assert(EventType(events[1]) == "RevisingStarted");
  assert(aggregate.Snapshot().data().max_iterations() == 4);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_REVISING);
}

void TestImplementationStartedIsNeverACommand() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));

  WorkflowCommand direct;
  direct.mutable_implementation_started()->set_max_iterations(3);
  bool threw = false;
  try {
    (void)aggregate.Handle(direct, planner::util::Now());
  } catch (const planner::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  WorkflowCommand override_cmd;
  override_cmd.mutable_user_override_approval()->set_override_reason("ship it");
  Run(&aggregate, StartPlanning());
  Run(&aggregate, PlanningCompleted());
  Run(&aggregate, override_cmd);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_COMPLETE);

  WorkflowCommand request;
  request.mutable_user_requested_implementation()->set_max_iterations(2);
  auto events = Run(&aggregate, request);
  assert(events.size() == 2);
  assert(EventType(events[0]) == "UserRequestedImplementation");
  assert(EventType(events[1]) == "ImplementationStarted");
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_IMPLEMENTING);
  assert(aggregate.Snapshot().data().implementation().max_iterations() == 2);
}

void TestImplementationLoopDetectsNoChanges() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));
  Run(&aggregate, StartPlanning());
  Run(&aggregate, PlanningCompleted());
  Run(&aggregate, CycleStarted(planner::v1::REVIEW_MODE_PARALLEL, {"claude"}));
  Run(&aggregate, Approve("claude"));
  Run(&aggregate, CycleCompleted(true));
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_COMPLETE);

  WorkflowCommand request;
  request.mutable_user_requested_implementation();
  Run(&aggregate, request);

  auto round = [&](std::uint32_t iteration, std::uint64_t fingerprint) {
    WorkflowCommand started;
    started.mutable_implementation_round_started()->set_iteration(iteration);
    Run(&aggregate, started);

    WorkflowCommand completed;
    completed.mutable_implementation_round_completed()->set_iteration(iteration);
    completed.mutable_implementation_round_completed()->set_fingerprint(fingerprint);
    return Run(&aggregate, completed);
  };

  assert(round(1, 0xabcdef).size() == 1);

  WorkflowCommand review;
  review.mutable_implementation_review_completed()->set_iteration(1);
  review.mutable_implementation_review_completed()->set_verdict(planner::v1::IMPLEMENTATION_VERDICT_NEEDS_CHANGES);
  review.mutable_implementation_review_completed()->set_feedback("missing tests");
  Run(&aggregate, review);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW);
  assert(aggregate.Snapshot().data().implementation().last_feedback() == "missing tests");

  auto events = round(2, 0xabcdef);
  assert(events.size() == 2);
  assert(EventType(events[1]) == "ImplementationNoChanges");
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION);

  WorkflowCommand approve;
  approve.mutable_user_approved();
  Run(&aggregate, approve);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_COMPLETE);
}

void TestReplayMatchesLiveState() {
  WorkflowAggregate          live;
  std::vector<WorkflowEvent> log;

  Run(&live, Create(2), &log);
  Run(&live, StartPlanning(), &log);
  Run(&live, PlanningCompleted(), &log);
  RejectedCycle(&live, &log);
  Run(&live, RevisingStarted(), &log);
  Run(&live, RevisionCompleted(), &log);
  RejectedCycle(&live, &log);

  WorkflowCommand conversation;
  conversation.mutable_record_agent_conversation()->set_agent_id("claude");
  conversation.mutable_record_agent_conversation()->set_conversation_id("conv-1");
  Run(&live, conversation, &log);

  WorkflowCommand declined;
  declined.mutable_user_declined()->set_feedback("needs a rollback section");
  Run(&live, declined, &log);
  assert(live.State() == planner::v1::LIFECYCLE_STATE_REVISING);

  WorkflowAggregate replayed;
  for (const auto& event : log) replayed.Apply(event);

  assert(google::protobuf::util::MessageDifferencer::Equals(live.Snapshot(), replayed.Snapshot()));
}

void TestFailureHistoryIsBounded() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));

  for (int i = 0; i < 60; ++i) {
    WorkflowCommand cmd;
    *cmd.mutable_record_failure()->mutable_failure() =
        planner::domain::NewFailure(planner::domain::MakeFailureKind(planner::v1::FAILURE_KIND_TIMEOUT), "attempt " + std::to_string(i),
                                    planner::v1::PHASE_LABEL_PLANNING, "claude", 2, planner::util::Now());
    Run(&aggregate, cmd);
  }

  const auto& data = aggregate.Snapshot().data();
  assert(data.failure_history_size() == static_cast<int>(planner::domain::kMaxFailureHistory));
  assert(data.failure_history(0).message() == "attempt 10");
  assert(data.last_failure().message() == "attempt 59");
}

void TestAbortCancelsAndIsTerminal() {
  WorkflowAggregate aggregate;
  Run(&aggregate, Create(3));

  WorkflowCommand abort;
  abort.mutable_user_aborted()->set_reason("user quit");
  Run(&aggregate, abort);
  assert(aggregate.State() == planner::v1::LIFECYCLE_STATE_CANCELLED);

  bool threw = false;
  try {
    (void)aggregate.Handle(abort, planner::util::Now());
  } catch (const planner::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateWorkflowInitializes();
  TestCommandBeforeCreateIsNotInitialized();
  TestStartPlanningIsIdempotent();
  TestRejectedCommandLeavesStateUnchanged();
  TestSequentialRejectionLeavesIterationUntilRevision();
  TestMaxIterationsExtendedPrecedesRevising();
  TestImplementationStartedIsNeverACommand();
  TestImplementationLoopDetectsNoChanges();
  TestReplayMatchesLiveState();
  TestFailureHistoryIsBounded();
  TestAbortCancelsAndIsTerminal();

  std::cout << "planner_unit_aggregate: pass\n";
  return 0;
}
