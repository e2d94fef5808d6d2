#pragma once

#include <functional>
#include <string>

#include <grpcpp/grpcpp.h>

namespace planner::grpc {

using TokenCheck = std::function<bool(const std::string&)>;

// Token from "authorization: Bearer <token>" metadata, empty when absent.
std::string BearerToken(const ::grpc::ServerContext& context);

// Throws util::AuthenticationFailed unless the bearer token passes `check`.
void RequireBearer(const ::grpc::ServerContext* context, const TokenCheck& check);

} // namespace planner::grpc
