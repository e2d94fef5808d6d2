#include "subscriber_listener.h"

#include <grpcpp/grpcpp.h>

#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::client {

namespace {

class CallbackService final : public v1::SubscriberCallback::Service {
 public:
  explicit CallbackService(const SubscriberHandlers* handlers) : handlers_(handlers) {
  }

  ::grpc::Status SessionChanged(::grpc::ServerContext*, const v1::SessionChangedRequest* req, v1::CallbackAck*) override {
    return Dispatch("SessionChanged", [&] {
      if (handlers_->on_session_changed) handlers_->on_session_changed(req->record());
    });
  }

  ::grpc::Status DaemonRestarting(::grpc::ServerContext*, const v1::DaemonRestartingRequest* req, v1::CallbackAck*) override {
    return Dispatch("DaemonRestarting", [&] {
      if (handlers_->on_daemon_restarting) handlers_->on_daemon_restarting(req->new_sha());
    });
  }

  ::grpc::Status Ping(::grpc::ServerContext*, const v1::PingRequest*, v1::PingResponse* resp) override {
    resp->set_healthy(true);
    return ::grpc::Status::OK;
  }

  ::grpc::Status WorkflowEventReceived(::grpc::ServerContext*, const v1::WorkflowEventRequest* req, v1::CallbackAck*) override {
    return Dispatch("WorkflowEventReceived", [&] {
      if (handlers_->on_workflow_event) handlers_->on_workflow_event(req->session_id(), req->envelope());
    });
  }

 private:
  template <typename Fn>
  ::grpc::Status Dispatch(const char* route, Fn&& fn) {
    try {
      fn();
      return ::grpc::Status::OK;
    } catch (const std::exception& e) {
      PLANNER_LOG_WARN("Subscriber handler failed",
                       {observability::StringField("route", route), observability::StringField("error", e.what())});
      return ::grpc::Status(::grpc::StatusCode::INTERNAL, e.what());
    }
  }

  const SubscriberHandlers* handlers_;
};

} // namespace

SubscriberListener::SubscriberListener(SubscriberHandlers handlers, std::string host)
    : handlers_(std::move(handlers)), host_(std::move(host)) {
}

SubscriberListener::~SubscriberListener() {
  Stop();
}

void SubscriberListener::Start() {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<CallbackService>(&handlers_));

  server_ = std::make_unique<runtime::Server>(runtime::JoinHostPort(host_, 0), std::move(services));
  server_->Start();
}

void SubscriberListener::Stop() {
  if (server_) {
    server_->Stop();
    server_.reset();
  }
}

std::string SubscriberListener::address() const {
  return runtime::JoinHostPort(host_, server_ ? static_cast<unsigned>(server_->port()) : 0U);
}

} // namespace planner::client
