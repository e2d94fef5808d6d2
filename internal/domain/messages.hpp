#pragma once

#include <string>

#include "planner/v1/commands.pb.h"
#include "planner/v1/events.pb.h"

namespace planner::domain {

constexpr const char* kEventVersion = "1";

// Name of the set oneof case, e.g. "CreateWorkflow". Empty when unset.
std::string CommandName(const v1::WorkflowCommand& command);
std::string EventType(const v1::WorkflowEvent& event);

} // namespace planner::domain
