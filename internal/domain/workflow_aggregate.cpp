#include "workflow_aggregate.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include "internal/domain/failure.hpp"
#include "internal/domain/messages.hpp"
#include "internal/domain/review.hpp"
#include "internal/domain/types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace planner::domain {

namespace {

using Command = v1::WorkflowCommand;
using Event   = v1::WorkflowEvent;
using observability::BoolField;
using observability::StringField;

[[noreturn]] void Reject(const Command& command, v1::LifecycleState state) {
  throw util::InvalidTransition("command '" + CommandName(command) + "' not valid in state '" + std::string(LifecycleName(state)) + "'");
}

[[noreturn]] void Reject(const std::string& reason) {
  throw util::InvalidTransition(reason);
}

template <typename Fill>
void Emit(std::vector<Event>* events, Fill&& fill) {
  Event event;
  fill(&event);
  events->push_back(std::move(event));
}

bool Contains(const ReviewerList& reviewers, const std::string& id) {
  return std::find(reviewers.begin(), reviewers.end(), id) != reviewers.end();
}

bool AlreadyVoted(const v1::WorkflowData& data, const std::string& id) {
  return std::any_of(data.current_cycle_reviews().begin(), data.current_cycle_reviews().end(),
                     [&](const v1::ReviewerResult& result) { return result.reviewer_id() == id; });
}

bool AtPlanningDecisionPoint(const v1::WorkflowData& data, v1::LifecycleState state) {
  return state == v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION || (state == v1::LIFECYCLE_STATE_COMPLETE && !data.has_implementation());
}

void CheckReviewerVote(const Command& command, const v1::WorkflowData& data, v1::LifecycleState state, const std::string& reviewer_id) {
  if (state != v1::LIFECYCLE_STATE_REVIEWING || !data.review_cycle_active()) {
    Reject(command, state);
  }
  if (!Contains(data.reviewers(), reviewer_id)) {
    Reject("reviewer '" + reviewer_id + "' is not part of the current review cycle");
  }
  if (AlreadyVoted(data, reviewer_id)) {
    Reject("reviewer '" + reviewer_id + "' already reviewed this cycle");
  }
  if (data.review_mode() == v1::REVIEW_MODE_SEQUENTIAL) {
    auto current = CurrentReviewer(data.sequential_review());
    if (!current) {
      Reject("sequential review cycle has no pending reviewer");
    }
    if (*current != reviewer_id) {
      Reject("sequential review expects '" + *current + "', got '" + reviewer_id + "'");
    }
  }
}

// ------------------------------------------------------------
// Planning commands
// ------------------------------------------------------------

void HandlePlanning(const Command& command, const v1::WorkflowData& data, v1::LifecycleState state, const google::protobuf::Timestamp& ts,
                    std::vector<Event>* events) {
  switch (command.command_case()) {
    case Command::kStartPlanning:
      if (state != v1::LIFECYCLE_STATE_PLANNING) Reject(command, state);
      if (!data.planning_started()) {
        Emit(events, [&](Event* e) { *e->mutable_planning_started()->mutable_started_at() = ts; });
      }
      return;

    case Command::kPlanningCompleted:
      if (state != v1::LIFECYCLE_STATE_PLANNING) Reject(command, state);
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_planning_completed();
        out->set_plan_path(command.planning_completed().plan_path().empty() ? data.plan_path() : command.planning_completed().plan_path());
        *out->mutable_completed_at() = ts;
      });
      return;

    case Command::kReviewCycleStarted: {
      const auto& cmd = command.review_cycle_started();
      if (state != v1::LIFECYCLE_STATE_REVIEWING || data.review_cycle_active()) Reject(command, state);
      if (cmd.reviewers().empty()) Reject("review cycle requires at least one reviewer");
      for (int i = 0; i < cmd.reviewers_size(); ++i) {
        if (cmd.reviewers(i).empty()) Reject("reviewer id must not be empty");
        if (std::count(cmd.reviewers().begin(), cmd.reviewers().end(), cmd.reviewers(i)) > 1) {
          Reject("reviewer '" + cmd.reviewers(i) + "' listed twice");
        }
      }
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_review_cycle_started();
        out->set_mode(cmd.mode());
        *out->mutable_reviewers() = cmd.reviewers();
        *out->mutable_started_at() = ts;
      });
      return;
    }

    case Command::kReviewerApproved:
      CheckReviewerVote(command, data, state, command.reviewer_approved().reviewer_id());
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_reviewer_approved();
        out->set_reviewer_id(command.reviewer_approved().reviewer_id());
        *out->mutable_approved_at() = ts;
      });
      return;

    case Command::kReviewerRejected:
      CheckReviewerVote(command, data, state, command.reviewer_rejected().reviewer_id());
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_reviewer_rejected();
        out->set_reviewer_id(command.reviewer_rejected().reviewer_id());
        out->set_feedback_path(command.reviewer_rejected().feedback_path());
        *out->mutable_rejected_at() = ts;
      });
      return;

    case Command::kReviewCycleCompleted: {
      if (state != v1::LIFECYCLE_STATE_REVIEWING || !data.review_cycle_active()) Reject(command, state);
      const bool approved = command.review_cycle_completed().approved();

      // The caller's verdict is authoritative even when the votes disagree.
      if (VotesApprove(data.current_cycle_reviews(), data.reviewers()) != approved) {
        PLANNER_LOG_WARN("Review cycle verdict disagrees with recorded votes",
                         {BoolField("approved", approved), StringField("feature", data.feature_name())});
      }

      Emit(events, [&](Event* e) {
        auto* out = e->mutable_review_cycle_completed();
        out->set_approved(approved);
        *out->mutable_completed_at() = ts;
      });
      if (!approved && data.iteration() >= data.max_iterations()) {
        Emit(events, [&](Event* e) { *e->mutable_planning_max_iterations_reached()->mutable_reached_at() = ts; });
      }
      return;
    }

    case Command::kRevisingStarted: {
      const auto& cmd = command.revising_started();
      if (state == v1::LIFECYCLE_STATE_REVISING) {
        if (cmd.has_additional_iterations()) {
          Reject("additional_iterations is only valid when leaving AwaitingPlanningDecision");
        }
      } else if (state == v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION) {
        const std::uint32_t additional = cmd.has_additional_iterations() ? cmd.additional_iterations() : 1;
        if (additional == 0) Reject("additional_iterations must be positive");
        // extension must precede the revision it unlocks
        Emit(events, [&](Event* e) {
          auto* out = e->mutable_max_iterations_extended();
          out->set_new_max(data.max_iterations() + additional);
          *out->mutable_extended_at() = ts;
        });
      } else {
        Reject(command, state);
      }
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_revising_started();
        out->set_feedback_summary(cmd.feedback_summary());
        *out->mutable_started_at() = ts;
      });
      return;
    }

    case Command::kRevisionCompleted:
      if (state != v1::LIFECYCLE_STATE_REVISING) Reject(command, state);
      if (data.iteration() + 1 > data.max_iterations()) {
        Reject("iteration " + std::to_string(data.iteration() + 1) + " would exceed max_iterations " + std::to_string(data.max_iterations()));
      }
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_revision_completed();
        out->set_plan_path(command.revision_completed().plan_path().empty() ? data.plan_path() : command.revision_completed().plan_path());
        *out->mutable_completed_at() = ts;
      });
      return;

    case Command::kPlanningMaxIterationsReached:
      if (state != v1::LIFECYCLE_STATE_REVIEWING && state != v1::LIFECYCLE_STATE_REVISING) Reject(command, state);
      Emit(events, [&](Event* e) { *e->mutable_planning_max_iterations_reached()->mutable_reached_at() = ts; });
      return;

    default:
      Reject(command, state);
  }
}

// ------------------------------------------------------------
// User decisions
// ------------------------------------------------------------

void HandleUser(const Command& command, const v1::WorkflowData& data, v1::LifecycleState state, const google::protobuf::Timestamp& ts,
                std::vector<Event>* events) {
  switch (command.command_case()) {
    case Command::kUserApproved:
      if (AtPlanningDecisionPoint(data, state)) {
        Emit(events, [&](Event* e) { *e->mutable_user_approved()->mutable_approved_at() = ts; });
        return;
      }
      if (state == v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION) {
        Emit(events, [&](Event* e) { *e->mutable_user_approved()->mutable_approved_at() = ts; });
        Emit(events, [&](Event* e) { *e->mutable_implementation_accepted()->mutable_approved_at() = ts; });
        return;
      }
      Reject(command, state);

    case Command::kUserRequestedImplementation: {
      if (!AtPlanningDecisionPoint(data, state)) Reject(command, state);
      const auto max = command.user_requested_implementation().max_iterations() == 0 ? kDefaultMaxIterations
                                                                                     : command.user_requested_implementation().max_iterations();
      Emit(events, [&](Event* e) { *e->mutable_user_requested_implementation()->mutable_requested_at() = ts; });
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_implementation_started();
        out->set_max_iterations(max);
        *out->mutable_started_at() = ts;
      });
      return;
    }

    case Command::kUserDeclined: {
      const auto& feedback = command.user_declined().feedback();
      if (AtPlanningDecisionPoint(data, state)) {
        Emit(events, [&](Event* e) {
          e->mutable_user_declined()->set_feedback(feedback);
          *e->mutable_user_declined()->mutable_declined_at() = ts;
        });
        if (data.iteration() >= data.max_iterations()) {
          Emit(events, [&](Event* e) {
            e->mutable_max_iterations_extended()->set_new_max(data.max_iterations() + 1);
            *e->mutable_max_iterations_extended()->mutable_extended_at() = ts;
          });
        }
        Emit(events, [&](Event* e) {
          e->mutable_revising_started()->set_feedback_summary(feedback);
          *e->mutable_revising_started()->mutable_started_at() = ts;
        });
        return;
      }
      if (state == v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION) {
        const auto next = data.implementation().iteration() + 1;
        Emit(events, [&](Event* e) {
          e->mutable_user_declined()->set_feedback(feedback);
          *e->mutable_user_declined()->mutable_declined_at() = ts;
        });
        if (next > data.implementation().max_iterations()) {
          Emit(events, [&](Event* e) {
            e->mutable_implementation_iterations_extended()->set_new_max(next);
            *e->mutable_implementation_iterations_extended()->mutable_extended_at() = ts;
          });
        }
        Emit(events, [&](Event* e) {
          e->mutable_implementation_round_started()->set_iteration(next);
          *e->mutable_implementation_round_started()->mutable_started_at() = ts;
        });
        return;
      }
      Reject(command, state);
    }

    case Command::kUserAborted:
      if (IsTerminal(state)) Reject(command, state);
      Emit(events, [&](Event* e) {
        e->mutable_user_aborted()->set_reason(command.user_aborted().reason());
        *e->mutable_user_aborted()->mutable_aborted_at() = ts;
      });
      return;

    case Command::kUserOverrideApproval:
      if (state != v1::LIFECYCLE_STATE_REVIEWING && state != v1::LIFECYCLE_STATE_REVISING &&
          state != v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION) {
        Reject(command, state);
      }
      Emit(events, [&](Event* e) {
        e->mutable_user_override_approval()->set_override_reason(command.user_override_approval().override_reason());
        *e->mutable_user_override_approval()->mutable_overridden_at() = ts;
      });
      return;

    default:
      Reject(command, state);
  }
}

// ------------------------------------------------------------
// Implementation loop
// ------------------------------------------------------------

void HandleImplementation(const Command& command, const v1::WorkflowData& data, v1::LifecycleState state,
                          const google::protobuf::Timestamp& ts, std::vector<Event>* events) {
  const auto& impl = data.implementation();

  switch (command.command_case()) {
    case Command::kImplementationStarted:
      Reject("ImplementationStarted is produced by UserRequestedImplementation and cannot be submitted directly");

    case Command::kImplementationRoundStarted: {
      const auto iteration = command.implementation_round_started().iteration();
      const bool first_round =
          state == v1::LIFECYCLE_STATE_IMPLEMENTING && !impl.round_in_progress() && !impl.round_completed() && iteration == impl.iteration();
      const bool next_round = state == v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW &&
                              impl.last_verdict() == v1::IMPLEMENTATION_VERDICT_NEEDS_CHANGES && iteration == impl.iteration() + 1 &&
                              iteration <= impl.max_iterations();
      if (!first_round && !next_round) Reject(command, state);
      Emit(events, [&](Event* e) {
        e->mutable_implementation_round_started()->set_iteration(iteration);
        *e->mutable_implementation_round_started()->mutable_started_at() = ts;
      });
      return;
    }

    case Command::kImplementationRoundCompleted: {
      const auto& cmd = command.implementation_round_completed();
      if (state != v1::LIFECYCLE_STATE_IMPLEMENTING || !impl.round_in_progress() || cmd.iteration() != impl.iteration()) {
        Reject(command, state);
      }
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_implementation_round_completed();
        out->set_iteration(cmd.iteration());
        out->set_fingerprint(cmd.fingerprint());
        *out->mutable_completed_at() = ts;
      });
      if (cmd.iteration() > 1 && impl.has_last_fingerprint() && impl.last_fingerprint() == cmd.fingerprint()) {
        Emit(events, [&](Event* e) {
          e->mutable_implementation_no_changes()->set_iteration(cmd.iteration());
          *e->mutable_implementation_no_changes()->mutable_detected_at() = ts;
        });
      }
      return;
    }

    case Command::kImplementationReviewCompleted: {
      const auto& cmd = command.implementation_review_completed();
      if (state != v1::LIFECYCLE_STATE_IMPLEMENTING || !impl.round_completed() || cmd.iteration() != impl.iteration()) {
        Reject(command, state);
      }
      if (cmd.verdict() == v1::IMPLEMENTATION_VERDICT_UNSPECIFIED) Reject("implementation review requires a verdict");
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_implementation_review_completed();
        out->set_iteration(cmd.iteration());
        out->set_verdict(cmd.verdict());
        if (cmd.has_feedback()) out->set_feedback(cmd.feedback());
        *out->mutable_completed_at() = ts;
      });
      if (cmd.verdict() == v1::IMPLEMENTATION_VERDICT_NEEDS_CHANGES && cmd.iteration() >= impl.max_iterations()) {
        Emit(events, [&](Event* e) { *e->mutable_implementation_max_iterations_reached()->mutable_reached_at() = ts; });
      }
      return;
    }

    case Command::kImplementationMaxIterationsReached:
      if (state != v1::LIFECYCLE_STATE_IMPLEMENTING && state != v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW) Reject(command, state);
      Emit(events, [&](Event* e) { *e->mutable_implementation_max_iterations_reached()->mutable_reached_at() = ts; });
      return;

    case Command::kImplementationAccepted:
      if (state != v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW && state != v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION) {
        Reject(command, state);
      }
      Emit(events, [&](Event* e) { *e->mutable_implementation_accepted()->mutable_approved_at() = ts; });
      return;

    case Command::kImplementationDeclined:
      if (state != v1::LIFECYCLE_STATE_IMPLEMENTING && state != v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW) Reject(command, state);
      Emit(events, [&](Event* e) {
        e->mutable_implementation_declined()->set_reason(command.implementation_declined().reason());
        *e->mutable_implementation_declined()->mutable_declined_at() = ts;
      });
      return;

    case Command::kImplementationCancelled:
      if (!IsImplementationState(state)) Reject(command, state);
      Emit(events, [&](Event* e) {
        e->mutable_implementation_cancelled()->set_reason(command.implementation_cancelled().reason());
        *e->mutable_implementation_cancelled()->mutable_cancelled_at() = ts;
      });
      return;

    default:
      Reject(command, state);
  }
}

// ------------------------------------------------------------
// Bookkeeping, valid in every initialized state
// ------------------------------------------------------------

void HandleBookkeeping(const Command& command, const v1::WorkflowData& data, const google::protobuf::Timestamp& ts,
                       std::vector<Event>* events) {
  switch (command.command_case()) {
    case Command::kRecordAgentConversation: {
      const auto& cmd = command.record_agent_conversation();
      if (cmd.agent_id().empty()) Reject("agent_id must not be empty");
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_agent_conversation_recorded();
        out->set_agent_id(cmd.agent_id());
        out->set_resume_strategy(cmd.resume_strategy());
        if (cmd.has_conversation_id()) out->set_conversation_id(cmd.conversation_id());
        *out->mutable_updated_at() = ts;
      });
      return;
    }

    case Command::kRecordInvocation: {
      const auto& cmd = command.record_invocation();
      if (cmd.agent_id().empty()) Reject("agent_id must not be empty");
      Emit(events, [&](Event* e) {
        auto* out = e->mutable_invocation_recorded();
        out->set_agent_id(cmd.agent_id());
        out->set_phase(cmd.phase());
        if (cmd.has_conversation_id()) out->set_conversation_id(cmd.conversation_id());
        out->set_resume_strategy(cmd.resume_strategy());
        *out->mutable_timestamp() = ts;
      });
      return;
    }

    case Command::kRecordFailure:
      Emit(events, [&](Event* e) {
        *e->mutable_failure_recorded()->mutable_failure() = command.record_failure().failure();
        *e->mutable_failure_recorded()->mutable_recorded_at() = ts;
      });
      return;

    case Command::kAttachWorktree: {
      const auto& cmd = command.attach_worktree();
      if (cmd.worktree_state().worktree_path().empty()) Reject("worktree_path must not be empty");
      if (data.has_worktree() && !cmd.replace()) {
        Reject("worktree already attached at '" + data.worktree().worktree_path() + "'");
      }
      Emit(events, [&](Event* e) { *e->mutable_worktree_attached()->mutable_worktree_state() = cmd.worktree_state(); });
      return;
    }

    default:
      break;
  }
}

bool IsBookkeeping(Command::CommandCase c) {
  return c == Command::kRecordAgentConversation || c == Command::kRecordInvocation || c == Command::kRecordFailure ||
         c == Command::kAttachWorktree;
}

bool IsUserDecision(Command::CommandCase c) {
  return c == Command::kUserApproved || c == Command::kUserRequestedImplementation || c == Command::kUserDeclined ||
         c == Command::kUserAborted || c == Command::kUserOverrideApproval;
}

bool IsImplementationCommand(Command::CommandCase c) {
  return c >= Command::kImplementationStarted && c <= Command::kImplementationCancelled;
}

} // namespace

WorkflowAggregate::WorkflowAggregate(v1::AggregateState state) : state_(std::move(state)) {
}

bool WorkflowAggregate::Initialized() const {
  return state_.has_data();
}

v1::LifecycleState WorkflowAggregate::State() const {
  return DeriveLifecycle(state_);
}

std::vector<v1::WorkflowEvent> WorkflowAggregate::Handle(const v1::WorkflowCommand& command, util::TimePoint now) const {
  const auto         state = State();
  const auto         ts    = util::ToProto(now);
  std::vector<Event> events;

  if (command.command_case() == Command::COMMAND_NOT_SET) {
    Reject("empty command");
  }

  if (command.has_create_workflow()) {
    if (state != v1::LIFECYCLE_STATE_UNINITIALIZED) Reject(command, state);
    const auto& cmd = command.create_workflow();
    if (cmd.feature_name().empty()) Reject("feature_name must not be empty");
    Emit(&events, [&](Event* e) {
      auto* out = e->mutable_workflow_created();
      out->set_feature_name(cmd.feature_name());
      out->set_objective(cmd.objective());
      out->set_working_dir(cmd.working_dir());
      out->set_max_iterations(cmd.max_iterations() == 0 ? kDefaultMaxIterations : cmd.max_iterations());
      out->set_plan_path(cmd.plan_path());
      out->set_feedback_path(cmd.feedback_path());
      *out->mutable_created_at() = ts;
    });
    return events;
  }

  if (!Initialized()) {
    throw util::NotInitialized();
  }

  const auto& data = state_.data();
  const auto  kind = command.command_case();
  if (IsBookkeeping(kind)) {
    HandleBookkeeping(command, data, ts, &events);
  } else if (IsUserDecision(kind)) {
    HandleUser(command, data, state, ts, &events);
  } else if (IsImplementationCommand(kind)) {
    HandleImplementation(command, data, state, ts, &events);
  } else {
    HandlePlanning(command, data, state, ts, &events);
  }
  return events;
}

void WorkflowAggregate::Apply(const v1::WorkflowEvent& event) {
  ApplyEvent(&state_, event);
}

// ------------------------------------------------------------
// Event application
// ------------------------------------------------------------

void ApplyEvent(v1::AggregateState* state, const v1::WorkflowEvent& event) {
  if (event.has_workflow_created()) {
    const auto& e    = event.workflow_created();
    auto*       data = state->mutable_data();
    data->Clear();
    data->set_feature_name(e.feature_name());
    data->set_objective(e.objective());
    data->set_working_dir(e.working_dir());
    data->set_plan_path(e.plan_path());
    data->set_feedback_path(e.feedback_path());
    data->set_iteration(1);
    data->set_max_iterations(e.max_iterations());
    *data->mutable_created_at() = e.created_at();
    data->set_planning_phase(v1::PLANNING_PHASE_PLANNING);
    return;
  }

  // events for an uninitialized aggregate carry nothing to fold
  if (!state->has_data()) {
    return;
  }
  auto* data = state->mutable_data();
  auto  impl = [data] { return data->mutable_implementation(); };

  switch (event.event_case()) {
    case Event::kPlanningStarted:
      data->set_planning_started(true);
      break;

    case Event::kPlanningCompleted:
      if (!event.planning_completed().plan_path().empty()) data->set_plan_path(event.planning_completed().plan_path());
      data->set_planning_phase(v1::PLANNING_PHASE_REVIEWING);
      break;

    case Event::kReviewCycleStarted: {
      const auto& e = event.review_cycle_started();
      data->set_review_mode(e.mode());
      *data->mutable_reviewers() = e.reviewers();
      data->set_review_cycle_active(true);
      data->clear_current_cycle_reviews();
      if (e.mode() == v1::REVIEW_MODE_SEQUENTIAL) {
        if (!data->has_sequential_review()) InitSequentialReview(data->mutable_sequential_review());
        StartCycle(data->mutable_sequential_review(), e.reviewers());
      }
      break;
    }

    case Event::kReviewerApproved: {
      const auto& id     = event.reviewer_approved().reviewer_id();
      auto*       result = data->add_current_cycle_reviews();
      result->set_reviewer_id(id);
      result->set_status(v1::FEEDBACK_STATUS_APPROVED);
      if (data->review_mode() == v1::REVIEW_MODE_SEQUENTIAL && data->has_sequential_review()) {
        auto* seq = data->mutable_sequential_review();
        RecordApproval(seq, id);
        IncrementRunCount(seq, id);
        AdvanceReviewer(seq);
      }
      break;
    }

    case Event::kReviewerRejected: {
      const auto& e      = event.reviewer_rejected();
      auto*       result = data->add_current_cycle_reviews();
      result->set_reviewer_id(e.reviewer_id());
      result->set_status(v1::FEEDBACK_STATUS_NEEDS_REVISION);
      result->set_feedback_path(e.feedback_path());
      if (data->review_mode() == v1::REVIEW_MODE_SEQUENTIAL && data->has_sequential_review()) {
        auto* seq = data->mutable_sequential_review();
        RecordRejection(seq, e.reviewer_id());
        IncrementRunCount(seq, e.reviewer_id());
        AdvanceReviewer(seq);
      }
      break;
    }

    case Event::kReviewCycleCompleted:
      data->set_review_cycle_active(false);
      data->set_planning_phase(event.review_cycle_completed().approved() ? v1::PLANNING_PHASE_COMPLETE : v1::PLANNING_PHASE_REVISING);
      if (data->has_sequential_review()) {
        data->mutable_sequential_review()->clear_cycle_order();
        data->mutable_sequential_review()->set_current_index(0);
      }
      break;

    case Event::kMaxIterationsExtended:
      data->set_max_iterations(std::max(data->max_iterations(), event.max_iterations_extended().new_max()));
      break;

    case Event::kRevisingStarted:
      data->set_planning_phase(v1::PLANNING_PHASE_REVISING);
      data->set_last_feedback_summary(event.revising_started().feedback_summary());
      data->set_decision_reason(v1::AWAITING_DECISION_REASON_UNSPECIFIED);
      break;

    case Event::kRevisionCompleted:
      data->set_iteration(data->iteration() + 1);
      if (!event.revision_completed().plan_path().empty()) data->set_plan_path(event.revision_completed().plan_path());
      data->set_planning_phase(v1::PLANNING_PHASE_REVIEWING);
      data->clear_current_cycle_reviews();
      if (data->has_sequential_review()) IncrementVersion(data->mutable_sequential_review());
      break;

    case Event::kPlanningMaxIterationsReached:
      data->set_planning_phase(v1::PLANNING_PHASE_AWAITING_DECISION);
      data->set_decision_reason(v1::AWAITING_DECISION_REASON_MAX_ITERATIONS_REACHED);
      data->set_review_cycle_active(false);
      break;

    case Event::kUserApproved:
      if (!data->has_implementation()) data->set_planning_phase(v1::PLANNING_PHASE_COMPLETE);
      break;

    case Event::kUserRequestedImplementation:
      data->set_planning_phase(v1::PLANNING_PHASE_COMPLETE);
      break;

    case Event::kUserDeclined:
      if (data->has_implementation()) impl()->set_last_feedback(event.user_declined().feedback());
      break;

    case Event::kUserAborted:
      data->set_cancelled(true);
      data->set_cancel_reason(event.user_aborted().reason());
      break;

    case Event::kUserOverrideApproval:
      data->set_planning_phase(v1::PLANNING_PHASE_COMPLETE);
      data->set_approval_overridden(true);
      data->set_override_reason(event.user_override_approval().override_reason());
      data->set_review_cycle_active(false);
      break;

    case Event::kImplementationStarted:
      impl()->Clear();
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_IMPLEMENTING);
      impl()->set_iteration(1);
      impl()->set_max_iterations(event.implementation_started().max_iterations());
      break;

    case Event::kImplementationRoundStarted:
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_IMPLEMENTING);
      impl()->set_iteration(event.implementation_round_started().iteration());
      impl()->set_round_in_progress(true);
      impl()->set_round_completed(false);
      impl()->set_decision_reason(v1::AWAITING_DECISION_REASON_UNSPECIFIED);
      break;

    case Event::kImplementationRoundCompleted:
      impl()->set_round_in_progress(false);
      impl()->set_round_completed(true);
      impl()->set_last_fingerprint(event.implementation_round_completed().fingerprint());
      break;

    case Event::kImplementationNoChanges:
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_AWAITING_DECISION);
      impl()->set_decision_reason(v1::AWAITING_DECISION_REASON_NO_CHANGES);
      break;

    case Event::kImplementationReviewCompleted: {
      const auto& e = event.implementation_review_completed();
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_REVIEW);
      impl()->set_last_verdict(e.verdict());
      impl()->set_last_feedback(e.has_feedback() ? e.feedback() : std::string());
      break;
    }

    case Event::kImplementationIterationsExtended:
      impl()->set_max_iterations(std::max(impl()->max_iterations(), event.implementation_iterations_extended().new_max()));
      break;

    case Event::kImplementationMaxIterationsReached:
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_AWAITING_DECISION);
      impl()->set_decision_reason(v1::AWAITING_DECISION_REASON_MAX_ITERATIONS_REACHED);
      break;

    case Event::kImplementationAccepted:
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_COMPLETE);
      break;

    case Event::kImplementationDeclined:
      impl()->set_phase(v1::IMPLEMENTATION_PHASE_COMPLETE);
      impl()->set_declined(true);
      impl()->set_decline_reason(event.implementation_declined().reason());
      break;

    case Event::kImplementationCancelled:
      data->set_cancelled(true);
      data->set_cancel_reason(event.implementation_cancelled().reason());
      break;

    case Event::kAgentConversationRecorded: {
      const auto& e            = event.agent_conversation_recorded();
      auto&       conversation = (*data->mutable_agent_conversations())[e.agent_id()];
      conversation.set_conversation_id(e.has_conversation_id() ? e.conversation_id() : std::string());
      conversation.set_resume_strategy(e.resume_strategy());
      *conversation.mutable_last_used_at() = e.updated_at();
      break;
    }

    case Event::kInvocationRecorded: {
      const auto& e      = event.invocation_recorded();
      auto*       record = data->add_invocations();
      record->set_agent_id(e.agent_id());
      record->set_phase(e.phase());
      *record->mutable_timestamp() = e.timestamp();
      if (e.has_conversation_id()) record->set_conversation_id(e.conversation_id());
      record->set_resume_strategy(e.resume_strategy());
      break;
    }

    case Event::kFailureRecorded:
      *data->mutable_last_failure() = event.failure_recorded().failure();
      AppendFailure(data->mutable_failure_history(), event.failure_recorded().failure());
      break;

    case Event::kWorktreeAttached:
      *data->mutable_worktree() = event.worktree_attached().worktree_state();
      break;

    default:
      break;
  }
}

} // namespace planner::domain
