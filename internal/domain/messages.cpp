#include "messages.hpp"

#include <google/protobuf/descriptor.h>

namespace planner::domain {

namespace {

std::string SetCaseTypeName(const google::protobuf::Message& message) {
  const auto* descriptor = message.GetDescriptor();
  if (descriptor->oneof_decl_count() == 0) {
    return {};
  }
  const auto* field = message.GetReflection()->GetOneofFieldDescriptor(message, descriptor->oneof_decl(0));
  if (field == nullptr || field->message_type() == nullptr) {
    return {};
  }
  return field->message_type()->name();
}

} // namespace

std::string CommandName(const v1::WorkflowCommand& command) {
  return SetCaseTypeName(command);
}

std::string EventType(const v1::WorkflowEvent& event) {
  return SetCaseTypeName(event);
}

} // namespace planner::domain
