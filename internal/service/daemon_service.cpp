#include "daemon_service.hpp"

#include "internal/daemon/session_registry.hpp"
#include "internal/daemon/shutdown_signal.hpp"
#include "internal/daemon/subscriber_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace planner::service {

using observability::IntField;
using observability::StringField;

DaemonService::DaemonService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

bool DaemonService::TokenMatches(const std::string& token) const {
  if (token.size() != ctx_.token.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < token.size(); ++i) {
    diff |= static_cast<unsigned char>(token[i] ^ ctx_.token[i]);
  }
  return diff == 0;
}

v1::AuthenticateResponse DaemonService::Authenticate(const v1::AuthenticateRequest& req) {
  return ObserveRpc("DaemonService.Authenticate", "", [&] {
    if (!TokenMatches(req.token())) {
      throw util::AuthenticationFailed();
    }
    return v1::AuthenticateResponse{};
  });
}

v1::RegisterResponse DaemonService::Register(const v1::RegisterRequest& req) {
  return ObserveRpc("DaemonService.Register", req.record().workflow_session_id(), [&] {
    if (req.record().workflow_session_id().empty()) {
      throw util::Internal("workflow_session_id must not be empty");
    }
    v1::RegisterResponse resp;
    resp.set_build_sha(ctx_.registry->Register(req.record()));
    return resp;
  });
}

v1::UpdateResponse DaemonService::Update(const v1::UpdateRequest& req) {
  return ObserveRpc("DaemonService.Update", req.record().workflow_session_id(), [&] {
    v1::UpdateResponse resp;
    resp.set_build_sha(ctx_.registry->Update(req.record()));
    return resp;
  });
}

v1::HeartbeatResponse DaemonService::Heartbeat(const v1::HeartbeatRequest& req) {
  return ObserveRpc("DaemonService.Heartbeat", req.session_id(), [&] {
    ctx_.registry->Heartbeat(req.session_id());
    return v1::HeartbeatResponse{};
  });
}

v1::ListResponse DaemonService::List(const v1::ListRequest&) {
  return ObserveRpc("DaemonService.List", "", [&] {
    v1::ListResponse resp;
    for (auto& record : ctx_.registry->List()) {
      *resp.add_sessions() = std::move(record);
    }
    return resp;
  });
}

v1::ForceStopResponse DaemonService::ForceStop(const v1::ForceStopRequest& req) {
  return ObserveRpc("DaemonService.ForceStop", req.session_id(), [&] {
    ctx_.registry->ForceStop(req.session_id());
    return v1::ForceStopResponse{};
  });
}

v1::ShutdownResponse DaemonService::Shutdown(const v1::ShutdownRequest&) {
  return ObserveRpc("DaemonService.Shutdown", "", [&] {
    BeginShutdown("shutdown requested");
    return v1::ShutdownResponse{};
  });
}

v1::BuildShaResponse DaemonService::BuildSha(const v1::BuildShaRequest&) {
  v1::BuildShaResponse resp;
  resp.set_build_sha(ctx_.build_sha);
  return resp;
}

v1::BuildTimestampResponse DaemonService::BuildTimestamp(const v1::BuildTimestampRequest&) {
  v1::BuildTimestampResponse resp;
  resp.set_build_timestamp(ctx_.build_timestamp);
  return resp;
}

v1::RequestUpgradeResponse DaemonService::RequestUpgrade(const v1::RequestUpgradeRequest& req) {
  return ObserveRpc("DaemonService.RequestUpgrade", "", [&] {
    v1::RequestUpgradeResponse resp;

    // strictly newer builds only; equal timestamps keep the running daemon
    if (req.caller_build_timestamp() <= ctx_.build_timestamp) {
      PLANNER_LOG_INFO("Upgrade refused", {IntField("caller_build_timestamp", static_cast<std::int64_t>(req.caller_build_timestamp())),
                                           IntField("build_timestamp", static_cast<std::int64_t>(ctx_.build_timestamp))});
      resp.set_accepted(false);
      return resp;
    }

    BeginShutdown("upgrade accepted");
    resp.set_accepted(true);
    return resp;
  });
}

v1::WorkflowEventResponse DaemonService::PublishWorkflowEvent(const v1::WorkflowEventRequest& req) {
  return ObserveRpc("DaemonService.PublishWorkflowEvent", req.session_id(), [&] {
    ctx_.notifier->Enqueue(req);
    return v1::WorkflowEventResponse{};
  });
}

void DaemonService::BeginShutdown(const char* reason) {
  // only the first caller announces the restart
  if (ctx_.registry->MarkShuttingDown()) {
    return;
  }
  PLANNER_LOG_INFO("Daemon shutting down", {StringField("reason", reason)});

  v1::DaemonRestartingRequest restarting;
  restarting.set_new_sha(ctx_.build_sha);
  ctx_.notifier->DeliverNow(restarting);

  ctx_.registry->Persist();
  ctx_.shutdown->Trigger();
}

} // namespace planner::service
