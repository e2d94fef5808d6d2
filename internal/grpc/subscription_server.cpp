#include "subscription_server.hpp"

#include "grpc_error.hpp"

namespace planner::grpc {

SubscriptionServer::SubscriptionServer(std::shared_ptr<service::SubscriptionService> svc, TokenCheck check)
    : service_(std::move(svc)), check_(std::move(check)) {
}

::grpc::Status SubscriptionServer::Subscribe(::grpc::ServerContext* ctx, const v1::SubscribeRequest* req, v1::SubscribeResponse* resp) {
  try {
    RequireBearer(ctx, check_);
    *resp = service_->Subscribe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::Unsubscribe(::grpc::ServerContext* ctx, const v1::UnsubscribeRequest* req, v1::UnsubscribeResponse* resp) {
  try {
    RequireBearer(ctx, check_);
    *resp = service_->Unsubscribe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace planner::grpc
