#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "planner/v1/state.pb.h"
#include "planner/v1/types.pb.h"

namespace planner::domain {

constexpr std::uint32_t kDefaultMaxIterations = 3;
constexpr std::size_t   kMaxFailureHistory    = 50;

// ------------------------------------------------------------
// Agent provider
// ------------------------------------------------------------

// Resolves "claude", "codex-reviewer", "gemini" ... by prefix.
v1::AgentProvider ProviderFromAgentId(std::string_view agent_id);
std::string_view  ProviderDisplayName(v1::AgentProvider provider);

// ------------------------------------------------------------
// Phase labels
// ------------------------------------------------------------

std::string_view PhaseShortLabel(v1::PhaseLabel phase);
std::string_view PhaseFullLabel(v1::PhaseLabel phase);

// "Reviewing #n" for n > 1, "Revising #n" always, otherwise the full label.
std::string PhaseWithIteration(v1::PhaseLabel phase, std::uint32_t iteration);

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

constexpr bool IsTerminal(v1::LifecycleState state) {
  return state == v1::LIFECYCLE_STATE_CANCELLED || state == v1::LIFECYCLE_STATE_COMPLETE;
}

constexpr bool IsImplementationState(v1::LifecycleState state) {
  return state == v1::LIFECYCLE_STATE_IMPLEMENTING || state == v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW ||
         state == v1::LIFECYCLE_STATE_AWAITING_IMPLEMENTATION_DECISION;
}

// "AwaitingPlanningDecision" style names used in error messages and logs.
std::string_view LifecycleName(v1::LifecycleState state);

v1::LifecycleState DeriveLifecycle(const v1::AggregateState& state);
v1::PhaseLabel     CurrentPhaseLabel(const v1::AggregateState& state);

} // namespace planner::domain
