#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/daemon_service.hpp"
#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::grpc {

class DaemonServer final : public v1::DaemonService::Service {
 public:
  explicit DaemonServer(std::shared_ptr<service::DaemonService> svc);

  ::grpc::Status Authenticate(::grpc::ServerContext*, const v1::AuthenticateRequest*, v1::AuthenticateResponse*) override;
  ::grpc::Status Register(::grpc::ServerContext*, const v1::RegisterRequest*, v1::RegisterResponse*) override;
  ::grpc::Status Update(::grpc::ServerContext*, const v1::UpdateRequest*, v1::UpdateResponse*) override;
  ::grpc::Status Heartbeat(::grpc::ServerContext*, const v1::HeartbeatRequest*, v1::HeartbeatResponse*) override;
  ::grpc::Status List(::grpc::ServerContext*, const v1::ListRequest*, v1::ListResponse*) override;
  ::grpc::Status ForceStop(::grpc::ServerContext*, const v1::ForceStopRequest*, v1::ForceStopResponse*) override;
  ::grpc::Status Shutdown(::grpc::ServerContext*, const v1::ShutdownRequest*, v1::ShutdownResponse*) override;
  ::grpc::Status BuildSha(::grpc::ServerContext*, const v1::BuildShaRequest*, v1::BuildShaResponse*) override;
  ::grpc::Status BuildTimestamp(::grpc::ServerContext*, const v1::BuildTimestampRequest*, v1::BuildTimestampResponse*) override;
  ::grpc::Status RequestUpgrade(::grpc::ServerContext*, const v1::RequestUpgradeRequest*, v1::RequestUpgradeResponse*) override;
  ::grpc::Status PublishWorkflowEvent(::grpc::ServerContext*, const v1::WorkflowEventRequest*, v1::WorkflowEventResponse*) override;

 private:
  std::shared_ptr<service::DaemonService> service_;
};

} // namespace planner::grpc
