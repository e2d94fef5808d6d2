#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::daemon {

constexpr std::uint32_t kHostProtocolVersion = 1;
constexpr std::uint16_t kDefaultHostPort     = 17717;

struct UpstreamTarget {
  // "auto" tries loopback first, then host.docker.internal
  std::string   host = "auto";
  std::uint16_t port = 0;
};

// The configured target with PLANNING_AGENT_HOST_PORT and
// PLANNING_AGENT_HOST_ADDRESS applied. Empty when the link is disabled.
std::optional<UpstreamTarget> ResolveUpstreamTarget(const planner::runtime::config::UpstreamConfig& config);

// PLANNING_AGENT_CONTAINER_ID / PLANNING_AGENT_CONTAINER_NAME, falling back
// to the hostname and the working directory's name.
v1::ContainerInfo LocalContainerInfo();

// initial * 2^attempt, capped at max.
std::chrono::milliseconds UpstreamBackoff(std::uint32_t attempt, std::chrono::milliseconds initial, std::chrono::milliseconds max);

/*
  UpstreamLink

  Keeps a container's daemon connected to the host aggregator. After a
  Hello handshake the full registry is synced, then session changes are
  forwarded as they happen and a heartbeat goes out on every idle
  interval. Any failed call drops the connection; reconnects back off
  exponentially and always start with a fresh sync, so changes made while
  disconnected are not queued.
*/
class UpstreamLink {
 public:
  using SessionsSnapshot = std::function<std::vector<v1::SessionRecord>()>;

  struct Options {
    std::chrono::milliseconds call_timeout{2000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds initial_backoff{5000};
    std::chrono::milliseconds max_backoff{60000};
  };

  UpstreamLink(UpstreamTarget target, v1::ContainerInfo container, SessionsSnapshot snapshot, Options options);
  ~UpstreamLink();

  UpstreamLink(const UpstreamLink&)            = delete;
  UpstreamLink& operator=(const UpstreamLink&) = delete;

  void Start();
  void Stop();

  // Dropped while disconnected; the next sync carries it.
  void Enqueue(const v1::SessionRecord& record);

  bool Connected() const;

 private:
  void Loop();
  bool Connect();
  bool Handshake(const std::string& address);
  bool SendUpdate(const v1::SessionRecord& record);
  bool SendHeartbeat();
  void ReportFailure(const std::string& what, const std::string& error);

  std::vector<std::string> CandidateAddresses() const;

  UpstreamTarget    target_;
  v1::ContainerInfo container_;
  SessionsSnapshot  snapshot_;
  Options           options_;

  mutable std::mutex            mutex_;
  std::condition_variable       cv_;
  std::deque<v1::SessionRecord> queue_;
  // accepting_ opens the queue before the sync snapshot is taken;
  // connected_ follows once the sync went through
  bool        accepting_ = false;
  bool        connected_ = false;
  bool        running_   = false;
  std::thread thread_;

  // worker thread only
  std::unique_ptr<v1::HostAggregator::Stub> stub_;
  std::string                               address_;
  std::uint32_t                             attempt_        = 0;
  bool                                      logged_failure_ = false;
};

} // namespace planner::daemon
