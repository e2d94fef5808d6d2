#pragma once

#include <functional>
#include <memory>
#include <string>

#include "planner/v1/daemon_service.pb.h"

namespace planner::runtime {
class Server;
}

namespace planner::client {

struct SubscriberHandlers {
  std::function<void(const v1::SessionRecord&)>                                        on_session_changed;
  std::function<void(const std::string& new_sha)>                                      on_daemon_restarting;
  std::function<void(const std::string& session_id, const v1::WorkflowEventEnvelope&)> on_workflow_event;
};

/*
  Hosts a SubscriberCallback server on an ephemeral loopback port.
  Handlers run on gRPC worker threads; unset handlers are skipped.
*/
class SubscriberListener {
 public:
  explicit SubscriberListener(SubscriberHandlers handlers, std::string host = "127.0.0.1");
  ~SubscriberListener();

  SubscriberListener(const SubscriberListener&)            = delete;
  SubscriberListener& operator=(const SubscriberListener&) = delete;

  void Start();
  void Stop();

  // host:port to hand to DaemonClient::Subscribe. Valid after Start().
  std::string address() const;

 private:
  SubscriberHandlers               handlers_;
  std::string                      host_;
  std::unique_ptr<runtime::Server> server_;
};

} // namespace planner::client
