#pragma once

#include <cstdint>
#include <string>

namespace planner::daemon {

// Injected by CMake as PLANNER_BUILD_SHA / PLANNER_BUILD_TIMESTAMP.
const std::string& BuildSha();
std::uint64_t      BuildTimestamp();

} // namespace planner::daemon
