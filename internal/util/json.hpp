#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace planner::util {

/*
  protobuf <-> JSON helpers.

  Field names keep their proto spelling (snake_case) so the files written
  by the store and the daemon stay stable across protobuf versions.
*/

std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Throws std::runtime_error on malformed input or unknown fields.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace planner::util
