#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace planner::daemon {
class SessionRegistry;
class SubscriberNotifier;
class SessionFileAccess;
class ShutdownSignal;
} // namespace planner::daemon

namespace planner::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<daemon::SessionRegistry>    registry;
  std::shared_ptr<daemon::SubscriberNotifier> notifier;
  std::shared_ptr<daemon::SessionFileAccess>  files;
  std::shared_ptr<daemon::ShutdownSignal>     shutdown;

  std::string   token;
  std::string   build_sha;
  std::uint64_t build_timestamp = 0;
};

} // namespace planner::service
