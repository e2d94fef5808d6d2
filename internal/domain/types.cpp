#include "types.hpp"

namespace planner::domain {

v1::AgentProvider ProviderFromAgentId(std::string_view agent_id) {
  auto starts_with = [&](std::string_view prefix) { return agent_id.substr(0, prefix.size()) == prefix; };
  if (starts_with("claude")) return v1::AGENT_PROVIDER_CLAUDE;
  if (starts_with("codex")) return v1::AGENT_PROVIDER_CODEX;
  if (starts_with("gemini")) return v1::AGENT_PROVIDER_GEMINI;
  return v1::AGENT_PROVIDER_UNSPECIFIED;
}

std::string_view ProviderDisplayName(v1::AgentProvider provider) {
  switch (provider) {
    case v1::AGENT_PROVIDER_CLAUDE:
      return "Claude";
    case v1::AGENT_PROVIDER_CODEX:
      return "Codex";
    case v1::AGENT_PROVIDER_GEMINI:
      return "Gemini";
    case v1::AGENT_PROVIDER_UNSPECIFIED:
    default:
      return "Unknown";
  }
}

std::string_view PhaseShortLabel(v1::PhaseLabel phase) {
  switch (phase) {
    case v1::PHASE_LABEL_PLANNING:
      return "Plan";
    case v1::PHASE_LABEL_REVIEWING:
      return "Review";
    case v1::PHASE_LABEL_REVISING:
      return "Revise";
    case v1::PHASE_LABEL_AWAITING_DECISION:
      return "Decide";
    case v1::PHASE_LABEL_IMPLEMENTING:
      return "Impl";
    case v1::PHASE_LABEL_IMPLEMENTATION_REVIEW:
      return "ImplRev";
    case v1::PHASE_LABEL_IMPLEMENTATION_AWAITING_DECISION:
      return "ImplDec";
    case v1::PHASE_LABEL_COMPLETE:
      return "Done";
    default:
      return "?";
  }
}

std::string_view PhaseFullLabel(v1::PhaseLabel phase) {
  switch (phase) {
    case v1::PHASE_LABEL_PLANNING:
      return "Planning";
    case v1::PHASE_LABEL_REVIEWING:
      return "Reviewing";
    case v1::PHASE_LABEL_REVISING:
      return "Revising";
    case v1::PHASE_LABEL_AWAITING_DECISION:
      return "Awaiting Decision";
    case v1::PHASE_LABEL_IMPLEMENTING:
      return "Implementing";
    case v1::PHASE_LABEL_IMPLEMENTATION_REVIEW:
      return "Implementation Review";
    case v1::PHASE_LABEL_IMPLEMENTATION_AWAITING_DECISION:
      return "Implementation Awaiting Decision";
    case v1::PHASE_LABEL_COMPLETE:
      return "Complete";
    default:
      return "Unknown";
  }
}

std::string PhaseWithIteration(v1::PhaseLabel phase, std::uint32_t iteration) {
  if (phase == v1::PHASE_LABEL_REVIEWING && iteration > 1) {
    return "Reviewing #" + std::to_string(iteration);
  }
  if (phase == v1::PHASE_LABEL_REVISING) {
    return "Revising #" + std::to_string(iteration);
  }
  return std::string(PhaseFullLabel(phase));
}

std::string_view LifecycleName(v1::LifecycleState state) {
  switch (state) {
    case v1::LIFECYCLE_STATE_UNINITIALIZED:
      return "Uninitialized";
    case v1::LIFECYCLE_STATE_PLANNING:
      return "Planning";
    case v1::LIFECYCLE_STATE_REVIEWING:
      return "Reviewing";
    case v1::LIFECYCLE_STATE_REVISING:
      return "Revising";
    case v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION:
      return "AwaitingPlanningDecision";
    case v1::LIFECYCLE_STATE_COMPLETE:
      return "Complete";
    case v1::LIFECYCLE_STATE_IMPLEMENTING:
      return "Implementing";
    case v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW:
      return "ImplementationReview";
    case v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION:
      return "AwaitingImplementationDecision";
    case v1::LIFECYCLE_STATE_CANCELLED:
      return "Cancelled";
    default:
      return "Unknown";
  }
}

v1::LifecycleState DeriveLifecycle(const v1::AggregateState& state) {
  if (!state.has_data()) {
    return v1::LIFECYCLE_STATE_UNINITIALIZED;
  }
  const auto& data = state.data();
  if (data.cancelled()) {
    return v1::LIFECYCLE_STATE_CANCELLED;
  }

  if (data.has_implementation()) {
    switch (data.implementation().phase()) {
      case v1::IMPLEMENTATION_PHASE_IMPLEMENTING:
        return v1::LIFECYCLE_STATE_IMPLEMENTING;
      case v1::IMPLEMENTATION_PHASE_REVIEW:
        return v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW;
      case v1::IMPLEMENTATION_PHASE_AWAITING_DECISION:
        return v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION;
      case v1::IMPLEMENTATION_PHASE_COMPLETE:
      default:
        return v1::LIFECYCLE_STATE_COMPLETE;
    }
  }

  switch (data.planning_phase()) {
    case v1::PLANNING_PHASE_PLANNING:
      return v1::LIFECYCLE_STATE_PLANNING;
    case v1::PLANNING_PHASE_REVIEWING:
      return v1::LIFECYCLE_STATE_REVIEWING;
    case v1::PLANNING_PHASE_REVISING:
      return v1::LIFECYCLE_STATE_REVISING;
    case v1::PLANNING_PHASE_AWAITING_DECISION:
      return v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION;
    case v1::PLANNING_PHASE_COMPLETE:
    default:
      return v1::LIFECYCLE_STATE_COMPLETE;
  }
}

v1::PhaseLabel CurrentPhaseLabel(const v1::AggregateState& state) {
  switch (DeriveLifecycle(state)) {
    case v1::LIFECYCLE_STATE_PLANNING:
    case v1::LIFECYCLE_STATE_UNINITIALIZED:
      return v1::PHASE_LABEL_PLANNING;
    case v1::LIFECYCLE_STATE_REVIEWING:
      return v1::PHASE_LABEL_REVIEWING;
    case v1::LIFECYCLE_STATE_REVISING:
      return v1::PHASE_LABEL_REVISING;
    case v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION:
      return v1::PHASE_LABEL_AWAITING_DECISION;
    case v1::LIFECYCLE_STATE_IMPLEMENTING:
      return v1::PHASE_LABEL_IMPLEMENTING;
    case v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW:
      return v1::PHASE_LABEL_IMPLEMENTATION_REVIEW;
    case v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION:
      return v1::PHASE_LABEL_IMPLEMENTATION_AWAITING_DECISION;
    default:
      return v1::PHASE_LABEL_COMPLETE;
  }
}

} // namespace planner::domain
