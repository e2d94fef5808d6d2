#include "subscription_service.hpp"

#include "internal/daemon/subscriber_notifier.hpp"
#include "internal/service/observe_rpc.hpp"

namespace planner::service {

SubscriptionService::SubscriptionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::SubscribeResponse SubscriptionService::Subscribe(const v1::SubscribeRequest& req) {
  return ObserveRpc("SubscriptionService.Subscribe", "", [&] {
    v1::SubscribeResponse resp;
    resp.set_subscriber_id(ctx_.notifier->Subscribe(req.callback_address()));
    return resp;
  });
}

v1::UnsubscribeResponse SubscriptionService::Unsubscribe(const v1::UnsubscribeRequest& req) {
  return ObserveRpc("SubscriptionService.Unsubscribe", "", [&] {
    ctx_.notifier->Unsubscribe(req.subscriber_id());
    return v1::UnsubscribeResponse{};
  });
}

} // namespace planner::service
