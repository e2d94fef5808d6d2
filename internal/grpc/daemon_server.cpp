#include "daemon_server.hpp"

#include "bearer_auth.hpp"
#include "grpc_error.hpp"

namespace planner::grpc {

namespace {

// Authenticated unary call: the token is checked before the handler runs.
template <typename Fn>
::grpc::Status Guarded(::grpc::ServerContext* context, const service::DaemonService& svc, Fn&& fn) {
  try {
    RequireBearer(context, [&](const std::string& token) { return svc.TokenMatches(token); });
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

template <typename Fn>
::grpc::Status Open(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

DaemonServer::DaemonServer(std::shared_ptr<service::DaemonService> svc) : service_(std::move(svc)) {
}

::grpc::Status DaemonServer::Authenticate(::grpc::ServerContext*, const v1::AuthenticateRequest* req, v1::AuthenticateResponse* resp) {
  return Open([&] { *resp = service_->Authenticate(*req); });
}

::grpc::Status DaemonServer::Register(::grpc::ServerContext* ctx, const v1::RegisterRequest* req, v1::RegisterResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->Register(*req); });
}

::grpc::Status DaemonServer::Update(::grpc::ServerContext* ctx, const v1::UpdateRequest* req, v1::UpdateResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->Update(*req); });
}

::grpc::Status DaemonServer::Heartbeat(::grpc::ServerContext* ctx, const v1::HeartbeatRequest* req, v1::HeartbeatResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->Heartbeat(*req); });
}

::grpc::Status DaemonServer::List(::grpc::ServerContext* ctx, const v1::ListRequest* req, v1::ListResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->List(*req); });
}

::grpc::Status DaemonServer::ForceStop(::grpc::ServerContext* ctx, const v1::ForceStopRequest* req, v1::ForceStopResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->ForceStop(*req); });
}

::grpc::Status DaemonServer::Shutdown(::grpc::ServerContext* ctx, const v1::ShutdownRequest* req, v1::ShutdownResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->Shutdown(*req); });
}

::grpc::Status DaemonServer::BuildSha(::grpc::ServerContext*, const v1::BuildShaRequest* req, v1::BuildShaResponse* resp) {
  return Open([&] { *resp = service_->BuildSha(*req); });
}

::grpc::Status DaemonServer::BuildTimestamp(::grpc::ServerContext*, const v1::BuildTimestampRequest* req, v1::BuildTimestampResponse* resp) {
  return Open([&] { *resp = service_->BuildTimestamp(*req); });
}

::grpc::Status DaemonServer::RequestUpgrade(::grpc::ServerContext*, const v1::RequestUpgradeRequest* req, v1::RequestUpgradeResponse* resp) {
  return Open([&] { *resp = service_->RequestUpgrade(*req); });
}

::grpc::Status DaemonServer::PublishWorkflowEvent(::grpc::ServerContext* ctx, const v1::WorkflowEventRequest* req, v1::WorkflowEventResponse* resp) {
  return Guarded(ctx, *service_, [&] { *resp = service_->PublishWorkflowEvent(*req); });
}

} // namespace planner::grpc
