#pragma once

#include "planner/v1/daemon_service.pb.h"
#include "service_context.hpp"

namespace planner::service {

/*
  Session registry operations behind DaemonService. Authentication of
  the caller happens in the transport adapter.
*/
class DaemonService {
 public:
  explicit DaemonService(ServiceContext ctx);

  v1::AuthenticateResponse   Authenticate(const v1::AuthenticateRequest& req);
  v1::RegisterResponse       Register(const v1::RegisterRequest& req);
  v1::UpdateResponse         Update(const v1::UpdateRequest& req);
  v1::HeartbeatResponse      Heartbeat(const v1::HeartbeatRequest& req);
  v1::ListResponse           List(const v1::ListRequest& req);
  v1::ForceStopResponse      ForceStop(const v1::ForceStopRequest& req);
  v1::ShutdownResponse       Shutdown(const v1::ShutdownRequest& req);
  v1::BuildShaResponse       BuildSha(const v1::BuildShaRequest& req);
  v1::BuildTimestampResponse BuildTimestamp(const v1::BuildTimestampRequest& req);
  v1::RequestUpgradeResponse RequestUpgrade(const v1::RequestUpgradeRequest& req);
  v1::WorkflowEventResponse  PublishWorkflowEvent(const v1::WorkflowEventRequest& req);

  bool TokenMatches(const std::string& token) const;

 private:
  // Notifies subscribers, refuses further mutations, persists and wakes main().
  void BeginShutdown(const char* reason);

  ServiceContext ctx_;
};

} // namespace planner::service
