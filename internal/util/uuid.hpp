#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace planner::util {

/*
  UUID helpers

  Workflow ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Random id in canonical form, used for new workflows.
std::string NewWorkflowId();

// Random alphanumeric string, used for the daemon bearer token.
std::string RandomAlphanumeric(std::size_t length);

} // namespace planner::util
