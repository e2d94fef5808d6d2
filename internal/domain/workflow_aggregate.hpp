#pragma once

#include <vector>

#include "internal/util/time.hpp"
#include "planner/v1/commands.pb.h"
#include "planner/v1/events.pb.h"
#include "planner/v1/state.pb.h"

namespace planner::domain {

/*
  WorkflowAggregate

  Authoritative, command-validating state machine for one workflow.

  Handle() validates a command and returns the events it produces without
  touching state; a rejected command throws a util::WorkflowError subclass
  and leaves the aggregate exactly as it was. Apply() folds one event into
  the state and never fails, so it is used both live and for replay.

  Not thread-safe. Each aggregate is owned by a single actor.
*/
class WorkflowAggregate {
 public:
  WorkflowAggregate() = default;
  explicit WorkflowAggregate(v1::AggregateState state);

  std::vector<v1::WorkflowEvent> Handle(const v1::WorkflowCommand& command, util::TimePoint now) const;

  void Apply(const v1::WorkflowEvent& event);

  bool               Initialized() const;
  v1::LifecycleState State() const;

  const v1::AggregateState& Snapshot() const {
    return state_;
  }

 private:
  v1::AggregateState state_;
};

// Folds one event into `state`. Shared by the aggregate and the view projection.
void ApplyEvent(v1::AggregateState* state, const v1::WorkflowEvent& event);

} // namespace planner::domain
