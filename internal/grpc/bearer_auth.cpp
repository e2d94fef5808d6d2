#include "bearer_auth.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace planner::grpc {

std::string BearerToken(const ::grpc::ServerContext& context) {
  static constexpr std::string_view kScheme = "Bearer ";

  const auto& metadata = context.client_metadata();
  auto        it       = metadata.find("authorization");
  if (it == metadata.end()) {
    return {};
  }
  std::string_view value(it->second.data(), it->second.size());
  if (value.substr(0, kScheme.size()) != kScheme) {
    return {};
  }
  return std::string(value.substr(kScheme.size()));
}

void RequireBearer(const ::grpc::ServerContext* context, const TokenCheck& check) {
  if (!context) {
    throw util::AuthenticationFailed();
  }
  const auto token = BearerToken(*context);
  if (token.empty() || !check(token)) {
    throw util::AuthenticationFailed();
  }
}

} // namespace planner::grpc
