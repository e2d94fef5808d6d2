#include "internal/daemon/upstream_link.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/daemon/session_registry.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"

namespace {

using namespace std::chrono_literals;
using planner::daemon::UpstreamLink;
using planner::v1::SessionRecord;

/*
  What a host aggregator saw, shared with the service the server owns.
*/
struct HostLog {
  std::mutex                                     mutex;
  std::vector<planner::v1::HelloRequest>         hellos;
  std::vector<planner::v1::SyncSessionsRequest>  syncs;
  std::vector<planner::v1::SessionUpdateRequest> updates;
  int                                            heartbeats       = 0;
  std::uint32_t                                  protocol_version = planner::daemon::kHostProtocolVersion;

  std::size_t Hellos() {
    std::lock_guard lock(mutex);
    return hellos.size();
  }
  std::size_t Syncs() {
    std::lock_guard lock(mutex);
    return syncs.size();
  }
  int Heartbeats() {
    std::lock_guard lock(mutex);
    return heartbeats;
  }
  bool Updated(const std::string& session_id, const std::string& phase) {
    std::lock_guard lock(mutex);
    for (const auto& update : updates) {
      if (update.record().workflow_session_id() == session_id && update.record().phase() == phase) return true;
    }
    return false;
  }
};

class FakeHost final : public planner::v1::HostAggregator::Service {
 public:
  explicit FakeHost(std::shared_ptr<HostLog> log) : log_(std::move(log)) {
  }

  ::grpc::Status Hello(::grpc::ServerContext*, const planner::v1::HelloRequest* req, planner::v1::HelloResponse* resp) override {
    std::lock_guard lock(log_->mutex);
    log_->hellos.push_back(*req);
    resp->set_host_version("test-host");
    resp->set_protocol_version(log_->protocol_version);
    return ::grpc::Status::OK;
  }

  ::grpc::Status SyncSessions(::grpc::ServerContext*, const planner::v1::SyncSessionsRequest* req, planner::v1::HostAck*) override {
    std::lock_guard lock(log_->mutex);
    log_->syncs.push_back(*req);
    return ::grpc::Status::OK;
  }

  ::grpc::Status SessionUpdate(::grpc::ServerContext*, const planner::v1::SessionUpdateRequest* req, planner::v1::HostAck*) override {
    std::lock_guard lock(log_->mutex);
    log_->updates.push_back(*req);
    return ::grpc::Status::OK;
  }

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const planner::v1::HostHeartbeatRequest*, planner::v1::HostAck*) override {
    std::lock_guard lock(log_->mutex);
    ++log_->heartbeats;
    return ::grpc::Status::OK;
  }

 private:
  std::shared_ptr<HostLog> log_;
};

std::unique_ptr<planner::runtime::Server> StartHost(const std::shared_ptr<HostLog>& log, int port = 0) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<FakeHost>(log));
  auto server = std::make_unique<planner::runtime::Server>(planner::runtime::JoinHostPort("127.0.0.1", static_cast<unsigned>(port)),
                                                           std::move(services));
  server->Start();
  return server;
}

template <typename Predicate>
bool Eventually(Predicate predicate) {
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(20ms);
  }
  return false;
}

SessionRecord Record(const std::string& id, const std::string& phase) {
  SessionRecord record;
  record.set_workflow_session_id(id);
  record.set_feature_name("upstream-" + id);
  record.set_phase(phase);
  record.set_pid(4242);
  return record;
}

planner::v1::ContainerInfo Container() {
  planner::v1::ContainerInfo info;
  info.set_container_id("test-container");
  info.set_container_name("Test Container");
  info.set_working_dir("/test");
  return info;
}

UpstreamLink::Options FastOptions() {
  UpstreamLink::Options options;
  options.call_timeout       = 500ms;
  options.heartbeat_interval = 50ms;
  options.initial_backoff    = 50ms;
  options.max_backoff        = 200ms;
  return options;
}

planner::daemon::UpstreamTarget Loopback(int port) {
  planner::daemon::UpstreamTarget target;
  target.host = "127.0.0.1";
  target.port = static_cast<std::uint16_t>(port);
  return target;
}

void TestBackoffDoublesUpToCap() {
  using planner::daemon::UpstreamBackoff;
  assert(UpstreamBackoff(0, 5s, 60s) == 5s);
  assert(UpstreamBackoff(1, 5s, 60s) == 10s);
  assert(UpstreamBackoff(2, 5s, 60s) == 20s);
  assert(UpstreamBackoff(3, 5s, 60s) == 40s);
  assert(UpstreamBackoff(4, 5s, 60s) == 60s);
  assert(UpstreamBackoff(5, 5s, 60s) == 60s);
  assert(UpstreamBackoff(1000, 5s, 60s) == 60s);
}

void TestTargetFollowsEnvironment() {
  ::unsetenv("PLANNING_AGENT_HOST_PORT");
  ::unsetenv("PLANNING_AGENT_HOST_ADDRESS");

  planner::runtime::config::UpstreamConfig config;
  config.set_host("auto");
  assert(!planner::daemon::ResolveUpstreamTarget(config));

  config.set_port(9000);
  auto target = planner::daemon::ResolveUpstreamTarget(config);
  assert(target && target->host == "auto" && target->port == 9000);

  ::setenv("PLANNING_AGENT_HOST_PORT", "12345", 1);
  ::setenv("PLANNING_AGENT_HOST_ADDRESS", "10.0.0.2", 1);
  target = planner::daemon::ResolveUpstreamTarget(config);
  assert(target && target->host == "10.0.0.2" && target->port == 12345);

  // zero switches the link off
  ::setenv("PLANNING_AGENT_HOST_PORT", "0", 1);
  assert(!planner::daemon::ResolveUpstreamTarget(config));

  ::setenv("PLANNING_AGENT_HOST_PORT", "not-a-port", 1);
  target = planner::daemon::ResolveUpstreamTarget(config);
  assert(target && target->port == planner::daemon::kDefaultHostPort);

  ::unsetenv("PLANNING_AGENT_HOST_PORT");
  ::unsetenv("PLANNING_AGENT_HOST_ADDRESS");
}

void TestSyncThenUpdatesThenHeartbeats() {
  auto log  = std::make_shared<HostLog>();
  auto host = StartHost(log);

  auto         snapshot = [] { return std::vector<SessionRecord>{Record("s1", "Planning"), Record("s2", "Reviewing")}; };
  UpstreamLink link(Loopback(host->port()), Container(), snapshot, FastOptions());
  link.Enqueue(Record("early", "Planning"));
  link.Start();

  assert(Eventually([&] { return link.Connected(); }));
  {
    std::lock_guard lock(log->mutex);
    assert(log->hellos.size() == 1);
    assert(log->hellos[0].container().container_id() == "test-container");
    assert(log->hellos[0].protocol_version() == planner::daemon::kHostProtocolVersion);
    assert(log->syncs.size() == 1);
    assert(log->syncs[0].sessions_size() == 2);
    assert(log->syncs[0].sessions(0).workflow_session_id() == "s1");
    assert(log->syncs[0].sessions(1).workflow_session_id() == "s2");
    // nothing queued before the connection; the sync covered it
    assert(log->updates.empty());
  }

  link.Enqueue(Record("s1", "Revising"));
  assert(Eventually([&] { return log->Updated("s1", "Revising"); }));
  assert(Eventually([&] { return log->Heartbeats() >= 2; }));

  link.Stop();
  assert(!link.Connected());
}

void TestReconnectsAndResyncs() {
  // borrow a free port, then leave it empty
  const int port = StartHost(std::make_shared<HostLog>())->port();

  UpstreamLink link(Loopback(port), Container(), [] { return std::vector<SessionRecord>{Record("s1", "Planning")}; }, FastOptions());
  link.Start();
  std::this_thread::sleep_for(300ms);
  assert(!link.Connected());

  auto first      = std::make_shared<HostLog>();
  auto first_host = StartHost(first, port);
  assert(Eventually([&] { return link.Connected() && first->Syncs() == 1; }));

  // the host goes away; the next heartbeat notices
  first_host->Stop();
  first_host.reset();
  assert(Eventually([&] { return !link.Connected(); }));

  auto second      = std::make_shared<HostLog>();
  auto second_host = StartHost(second, port);
  assert(Eventually([&] { return link.Connected() && second->Syncs() == 1; }));
  {
    std::lock_guard lock(second->mutex);
    assert(second->syncs[0].sessions(0).workflow_session_id() == "s1");
  }

  link.Stop();
}

void TestProtocolMismatchNeverSyncs() {
  auto log              = std::make_shared<HostLog>();
  log->protocol_version = planner::daemon::kHostProtocolVersion + 100;
  auto host             = StartHost(log);

  UpstreamLink link(Loopback(host->port()), Container(), [] { return std::vector<SessionRecord>{}; }, FastOptions());
  link.Start();

  // retried with backoff, never accepted
  assert(Eventually([&] { return log->Hellos() >= 2; }));
  assert(!link.Connected());
  assert(log->Syncs() == 0);

  link.Stop();
}

void TestDaemonForwardsRegistryChanges() {
  auto log  = std::make_shared<HostLog>();
  auto host = StartHost(log);

  const auto home = std::filesystem::temp_directory_path() / "planner_upstream_link_tests" / "daemon";
  std::filesystem::remove_all(home);
  std::filesystem::create_directories(home);

  ::setenv("PLANNING_AGENT_HOST_PORT", std::to_string(host->port()).c_str(), 1);
  ::setenv("PLANNING_AGENT_HOST_ADDRESS", "127.0.0.1", 1);
  ::setenv("PLANNING_AGENT_CONTAINER_ID", "daemon-container", 1);

  auto config = planner::config::ConfigLoader::Defaults();
  config.mutable_daemon()->set_home_dir(home.string());
  config.mutable_daemon()->mutable_upstream()->set_initial_backoff_ms(50);

  auto app = planner::factory::Build(config);
  assert(app.upstream);
  assert(Eventually([&] { return app.upstream->Connected(); }));

  app.registry->Register(Record("s1", "Planning"));
  assert(Eventually([&] { return log->Updated("s1", "Planning"); }));
  {
    std::lock_guard lock(log->mutex);
    assert(log->hellos[0].container().container_id() == "daemon-container");
    assert(log->updates.back().container_id() == "daemon-container");
  }

  app.Stop();

  ::unsetenv("PLANNING_AGENT_HOST_PORT");
  ::unsetenv("PLANNING_AGENT_HOST_ADDRESS");
  ::unsetenv("PLANNING_AGENT_CONTAINER_ID");

  // without a port there is no link
  auto quiet = planner::factory::Build(config);
  assert(!quiet.upstream);
  quiet.Stop();
}

} // namespace

int main() {
  TestBackoffDoublesUpToCap();
  TestTargetFollowsEnvironment();
  TestSyncThenUpdatesThenHeartbeats();
  TestReconnectsAndResyncs();
  TestProtocolMismatchNeverSyncs();
  TestDaemonForwardsRegistryChanges();

  std::cout << "planner_unit_upstream_link: pass\n";
  return 0;
}
