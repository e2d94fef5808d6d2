#include "upstream_link.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include "internal/daemon/build_info.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

namespace planner::daemon {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::uint32_t kMaxBackoffAttempt = 16;

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* raw = std::getenv(name);
  return raw && *raw ? std::string(raw) : fallback;
}

} // namespace

std::optional<UpstreamTarget> ResolveUpstreamTarget(const planner::runtime::config::UpstreamConfig& config) {
  UpstreamTarget target;
  target.host = EnvOr("PLANNING_AGENT_HOST_ADDRESS", config.host().empty() ? "auto" : config.host());

  std::uint32_t port = config.port();
  const char*   raw  = std::getenv("PLANNING_AGENT_HOST_PORT");
  if (raw && *raw) {
    char*      end   = nullptr;
    const auto value = std::strtoul(raw, &end, 10);
    if (*end != '\0' || value > 65535) {
      PLANNER_LOG_WARN("Invalid PLANNING_AGENT_HOST_PORT, using the default host port",
                       {StringField("value", raw), IntField("port", kDefaultHostPort)});
      port = kDefaultHostPort;
    } else {
      port = static_cast<std::uint32_t>(value);
    }
  }

  if (port == 0 || port > 65535) {
    return std::nullopt;
  }
  target.port = static_cast<std::uint16_t>(port);
  return target;
}

v1::ContainerInfo LocalContainerInfo() {
  char hostname[256] = {};
  if (::gethostname(hostname, sizeof(hostname) - 1) != 0) {
    hostname[0] = '\0';
  }

  std::error_code ec;
  const auto      cwd = std::filesystem::current_path(ec);

  v1::ContainerInfo info;
  info.set_container_id(EnvOr("PLANNING_AGENT_CONTAINER_ID", *hostname ? hostname : "unknown"));
  const auto dir_name = ec ? std::string() : cwd.filename().string();
  info.set_container_name(EnvOr("PLANNING_AGENT_CONTAINER_NAME", dir_name.empty() ? info.container_id() : dir_name));
  info.set_working_dir(ec ? "/" : cwd.string());
  info.set_build_sha(BuildSha());
  info.set_build_timestamp(BuildTimestamp());
  return info;
}

std::chrono::milliseconds UpstreamBackoff(std::uint32_t attempt, std::chrono::milliseconds initial, std::chrono::milliseconds max) {
  auto delay = initial;
  for (std::uint32_t i = 0; i < attempt && delay < max; ++i) {
    delay *= 2;
  }
  return std::min(delay, max);
}

// ------------------------------------------------------------
// UpstreamLink
// ------------------------------------------------------------

UpstreamLink::UpstreamLink(UpstreamTarget target, v1::ContainerInfo container, SessionsSnapshot snapshot, Options options)
    : target_(std::move(target)), container_(std::move(container)), snapshot_(std::move(snapshot)), options_(options) {
}

UpstreamLink::~UpstreamLink() {
  Stop();
}

void UpstreamLink::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&UpstreamLink::Loop, this);
}

void UpstreamLink::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void UpstreamLink::Enqueue(const v1::SessionRecord& record) {
  {
    std::lock_guard lock(mutex_);
    if (!accepting_) return;
    queue_.push_back(record);
  }
  cv_.notify_one();
}

bool UpstreamLink::Connected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

std::vector<std::string> UpstreamLink::CandidateAddresses() const {
  if (target_.host != "auto") {
    return {runtime::JoinHostPort(target_.host, target_.port)};
  }
  // a daemon on the host machine, then one inside a container
  return {runtime::JoinHostPort("127.0.0.1", target_.port), runtime::JoinHostPort("host.docker.internal", target_.port)};
}

void UpstreamLink::ReportFailure(const std::string& what, const std::string& error) {
  // no host running is the common case; say so once per outage
  if (!logged_failure_) {
    PLANNER_LOG_WARN(what + ", will keep retrying", {StringField("error", error)});
    logged_failure_ = true;
  } else {
    PLANNER_LOG_DEBUG(what, {StringField("error", error)});
  }
}

bool UpstreamLink::Handshake(const std::string& address) {
  auto stub = v1::HostAggregator::NewStub(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials()));

  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + options_.call_timeout);

  v1::HelloRequest request;
  *request.mutable_container() = container_;
  request.set_protocol_version(kHostProtocolVersion);

  v1::HelloResponse response;
  auto              status = stub->Hello(&context, request, &response);
  if (!status.ok()) {
    ReportFailure("Host aggregator unreachable", address + ": " + status.error_message());
    return false;
  }
  if (response.protocol_version() != kHostProtocolVersion) {
    ReportFailure("Host aggregator protocol mismatch", "host speaks " + std::to_string(response.protocol_version()) + ", expected " +
                                                           std::to_string(kHostProtocolVersion));
    return false;
  }

  PLANNER_LOG_DEBUG("Host aggregator handshake complete", {StringField("address", address), StringField("host_version", response.host_version())});
  stub_    = std::move(stub);
  address_ = address;
  return true;
}

bool UpstreamLink::Connect() {
  bool shaken = false;
  for (const auto& address : CandidateAddresses()) {
    if (Handshake(address)) {
      shaken = true;
      break;
    }
  }
  if (!shaken) return false;

  {
    std::lock_guard lock(mutex_);
    queue_.clear();
    accepting_ = true;
  }

  v1::SyncSessionsRequest sync;
  sync.set_container_id(container_.container_id());
  for (auto& record : snapshot_()) {
    *sync.add_sessions() = std::move(record);
  }

  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + options_.call_timeout);
  v1::HostAck ack;
  auto        status = stub_->SyncSessions(&context, sync, &ack);
  if (!status.ok()) {
    ReportFailure("Session sync to host aggregator failed", status.error_message());
    std::lock_guard lock(mutex_);
    accepting_ = false;
    queue_.clear();
    stub_.reset();
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    connected_ = true;
  }
  attempt_        = 0;
  logged_failure_ = false;
  PLANNER_LOG_INFO("Connected to host aggregator",
                   {StringField("address", address_), IntField("sessions", static_cast<std::int64_t>(sync.sessions_size()))});
  return true;
}

bool UpstreamLink::SendUpdate(const v1::SessionRecord& record) {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + options_.call_timeout);

  v1::SessionUpdateRequest request;
  request.set_container_id(container_.container_id());
  *request.mutable_record() = record;

  v1::HostAck ack;
  auto        status = stub_->SessionUpdate(&context, request, &ack);
  if (!status.ok()) {
    PLANNER_LOG_WARN("Session update to host aggregator failed",
                     {StringField("session_id", record.workflow_session_id()), StringField("error", status.error_message())});
  }
  return status.ok();
}

bool UpstreamLink::SendHeartbeat() {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + options_.call_timeout);

  v1::HostHeartbeatRequest request;
  request.set_container_id(container_.container_id());

  v1::HostAck ack;
  auto        status = stub_->Heartbeat(&context, request, &ack);
  if (!status.ok()) {
    PLANNER_LOG_WARN("Heartbeat to host aggregator failed", {StringField("error", status.error_message())});
  }
  return status.ok();
}

void UpstreamLink::Loop() {
  auto next_heartbeat = std::chrono::steady_clock::now();

  std::unique_lock lock(mutex_);
  while (running_) {
    if (!connected_) {
      lock.unlock();
      const bool ok = Connect();
      lock.lock();

      if (!ok) {
        const auto delay = UpstreamBackoff(attempt_, options_.initial_backoff, options_.max_backoff);
        attempt_         = std::min(attempt_ + 1, kMaxBackoffAttempt);
        cv_.wait_for(lock, delay, [this] { return !running_; });
        continue;
      }
      next_heartbeat = std::chrono::steady_clock::now() + options_.heartbeat_interval;
    }

    cv_.wait_until(lock, next_heartbeat, [&] { return !running_ || !queue_.empty(); });
    if (!running_) break;

    bool ok = true;
    if (std::chrono::steady_clock::now() >= next_heartbeat) {
      lock.unlock();
      ok = SendHeartbeat();
      lock.lock();
      next_heartbeat = std::chrono::steady_clock::now() + options_.heartbeat_interval;
    } else if (!queue_.empty()) {
      auto record = std::move(queue_.front());
      queue_.pop_front();

      lock.unlock();
      ok = SendUpdate(record);
      lock.lock();
    }

    if (!ok) {
      // the reconnect resyncs everything, queued changes included
      PLANNER_LOG_INFO("Disconnected from host aggregator", {StringField("address", address_)});
      accepting_ = false;
      connected_ = false;
      queue_.clear();
      stub_.reset();
    }
  }

  accepting_ = false;
  connected_ = false;
  queue_.clear();
}

} // namespace planner::daemon
