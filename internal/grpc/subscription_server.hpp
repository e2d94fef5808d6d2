#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/bearer_auth.hpp"
#include "internal/service/subscription_service.hpp"
#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::grpc {

class SubscriptionServer final : public v1::SubscriptionService::Service {
 public:
  SubscriptionServer(std::shared_ptr<service::SubscriptionService> svc, TokenCheck check);

  ::grpc::Status Subscribe(::grpc::ServerContext*, const v1::SubscribeRequest*, v1::SubscribeResponse*) override;
  ::grpc::Status Unsubscribe(::grpc::ServerContext*, const v1::UnsubscribeRequest*, v1::UnsubscribeResponse*) override;

 private:
  std::shared_ptr<service::SubscriptionService> service_;
  TokenCheck                                    check_;
};

} // namespace planner::grpc
