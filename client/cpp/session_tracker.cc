#include "session_tracker.h"

#include <unistd.h>

#include <algorithm>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace planner::client {

namespace {

constexpr std::uint32_t kReconnectThreshold = 2;
constexpr auto          kMaxBackoff         = std::chrono::milliseconds(60000);

} // namespace

SessionTracker::SessionTracker(std::filesystem::path port_file, std::chrono::milliseconds rpc_timeout,
                               std::chrono::milliseconds heartbeat_interval)
    : port_file_(std::move(port_file)), rpc_timeout_(rpc_timeout), heartbeat_interval_(heartbeat_interval) {
}

SessionTracker::~SessionTracker() {
  Stop();
}

void SessionTracker::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread([this] { Loop(); });
}

void SessionTracker::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::shared_ptr<DaemonClient> SessionTracker::Client() {
  std::lock_guard lock(mutex_);
  if (!client_) {
    client_ = std::make_shared<DaemonClient>(DaemonClient::FromPortFile(port_file_, "127.0.0.1", rpc_timeout_));
  }
  return client_;
}

void SessionTracker::Register(v1::SessionRecord record) {
  const auto now = util::ToProto(util::Now());
  record.set_pid(static_cast<std::uint32_t>(::getpid()));
  record.set_liveness(v1::LIVENESS_STATE_RUNNING);
  *record.mutable_updated_at()        = now;
  *record.mutable_last_heartbeat_at() = now;

  Client()->Register(record);

  std::lock_guard lock(mutex_);
  sessions_[record.workflow_session_id()] = std::move(record);
}

void SessionTracker::Update(const std::string& session_id, const std::string& phase, std::uint32_t iteration,
                            const std::string& workflow_status) {
  v1::SessionRecord record;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) return;

    it->second.set_phase(phase);
    it->second.set_iteration(iteration);
    it->second.set_workflow_status(workflow_status);
    *it->second.mutable_updated_at() = util::ToProto(util::Now());
    record                           = it->second;
  }
  Client()->Update(record);
}

void SessionTracker::MarkStopped(const std::string& session_id) {
  v1::SessionRecord record;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) return;

    record = std::move(it->second);
    sessions_.erase(it);
  }
  record.set_liveness(v1::LIVENESS_STATE_STOPPED);
  *record.mutable_updated_at() = util::ToProto(util::Now());
  Client()->Update(record);
}

void SessionTracker::PublishWorkflowEvent(const std::string& session_id, const v1::WorkflowEventEnvelope& envelope) {
  Client()->PublishWorkflowEvent(session_id, envelope);
}

std::size_t SessionTracker::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

// ------------------------------------------------------------
// Heartbeat loop
// ------------------------------------------------------------

void SessionTracker::Loop() {
  backoff_ = heartbeat_interval_;

  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, backoff_, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    HeartbeatRound();
    lock.lock();
  }
}

void SessionTracker::HeartbeatRound() {
  std::vector<std::string> ids;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, record] : sessions_) ids.push_back(id);
  }
  if (ids.empty()) {
    consecutive_failures_ = 0;
    return;
  }

  bool any_failed = false;
  for (const auto& id : ids) {
    try {
      Client()->Heartbeat(id);
    } catch (const util::SessionNotFound&) {
      // the daemon swept or dropped the record while this process lived on
      if (!Reregister(id)) any_failed = true;
    } catch (const std::exception& e) {
      any_failed = true;
      if (consecutive_failures_ == 0) {
        PLANNER_LOG_WARN("Heartbeat failed", {observability::StringField("session_id", id), observability::StringField("error", e.what())});
      }
    }
  }

  if (!any_failed) {
    consecutive_failures_ = 0;
    backoff_              = heartbeat_interval_;
    return;
  }

  if (++consecutive_failures_ >= kReconnectThreshold) {
    try {
      Reconnect();
      consecutive_failures_ = 0;
      backoff_              = heartbeat_interval_;
    } catch (const std::exception& e) {
      backoff_ = std::min(backoff_ * 2, kMaxBackoff);
      PLANNER_LOG_WARN("Reconnect to session daemon failed",
                       {observability::StringField("error", e.what()), observability::IntField("backoff_ms", backoff_.count())});
    }
  }
}

bool SessionTracker::Reregister(const std::string& session_id) {
  v1::SessionRecord record;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) return true;
    record = it->second;
  }

  try {
    Client()->Register(record);
  } catch (const std::exception& e) {
    PLANNER_LOG_WARN("Re-register failed", {observability::StringField("session_id", session_id), observability::StringField("error", e.what())});
    return false;
  }
  PLANNER_LOG_INFO("Session re-registered after daemon lost it", {observability::StringField("session_id", session_id)});
  return true;
}

void SessionTracker::Reconnect() {
  auto client = std::make_shared<DaemonClient>(DaemonClient::FromPortFile(port_file_, "127.0.0.1", rpc_timeout_));

  std::vector<v1::SessionRecord> records;
  {
    std::lock_guard lock(mutex_);
    client_ = client;
    for (const auto& [id, record] : sessions_) records.push_back(record);
  }

  for (const auto& record : records) {
    try {
      client->Register(record);
    } catch (const std::exception& e) {
      // The next round notices and reconnects again.
      PLANNER_LOG_WARN("Re-register failed",
                       {observability::StringField("session_id", record.workflow_session_id()), observability::StringField("error", e.what())});
    }
  }
  PLANNER_LOG_INFO("Reconnected to session daemon", {observability::IntField("sessions", static_cast<std::int64_t>(records.size()))});
}

} // namespace planner::client
