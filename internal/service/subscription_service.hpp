#pragma once

#include "planner/v1/daemon_service.pb.h"
#include "service_context.hpp"

namespace planner::service {

class SubscriptionService {
 public:
  explicit SubscriptionService(ServiceContext ctx);

  v1::SubscribeResponse   Subscribe(const v1::SubscribeRequest& req);
  v1::UnsubscribeResponse Unsubscribe(const v1::UnsubscribeRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace planner::service
