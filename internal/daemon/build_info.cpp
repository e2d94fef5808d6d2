#include "build_info.hpp"

#ifndef PLANNER_BUILD_SHA
#define PLANNER_BUILD_SHA "unknown"
#endif

#ifndef PLANNER_BUILD_TIMESTAMP
#define PLANNER_BUILD_TIMESTAMP 0
#endif

namespace planner::daemon {

const std::string& BuildSha() {
  static const std::string sha = PLANNER_BUILD_SHA;
  return sha;
}

std::uint64_t BuildTimestamp() {
  return static_cast<std::uint64_t>(PLANNER_BUILD_TIMESTAMP);
}

} // namespace planner::daemon
