#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace planner::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The status details carry a serialized planner.v1.ErrorDetail so the
  client can rebuild the typed exception with RaiseForStatus().
*/
::grpc::Status ToStatus(const std::exception& e);

// Throws the exception described by a non-OK status; no-op on OK.
void RaiseForStatus(const ::grpc::Status& status);

} // namespace planner::grpc
