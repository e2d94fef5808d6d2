#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace planner::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::uint64_t ToUnixMillis(TimePoint tp);

// Whole seconds elapsed from `since` to `now`, clamped at zero.
std::int64_t ElapsedSeconds(const google::protobuf::Timestamp& since, TimePoint now);

} // namespace planner::util
