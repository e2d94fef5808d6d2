#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/daemon/daemon_paths.hpp"

namespace planner::daemon {
class SessionRegistry;
class SubscriberNotifier;
class LivenessSweeper;
class ShutdownSignal;
class UpstreamLink;
} // namespace planner::daemon

namespace planner::factory {

/*
  Application

  Owns every long-lived piece of the session daemon. `grpc_services`
  are served on daemon.port, `subscriber_services` on
  daemon.subscriber_port.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::vector<std::unique_ptr<::grpc::Service>> subscriber_services;

  std::shared_ptr<daemon::SessionRegistry>    registry;
  std::shared_ptr<daemon::SubscriberNotifier> notifier;
  std::shared_ptr<daemon::LivenessSweeper>    sweeper;
  std::shared_ptr<daemon::ShutdownSignal>     shutdown;
  // null unless a host aggregator port is configured
  std::shared_ptr<daemon::UpstreamLink> upstream;

  daemon::DaemonPaths paths;
  std::string         token;

  // Stops background workers and persists the registry.
  void Stop();
};

/*
  Build

  Composition root of the daemon: loads the registry, starts the
  background workers and wires services to their transports.
*/
Application Build(const planner::runtime::config::RuntimeConfig& config);

} // namespace planner::factory
