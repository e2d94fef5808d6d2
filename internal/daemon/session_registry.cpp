#include "session_registry.hpp"

#include <cstdlib>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"

namespace planner::daemon {

using observability::IntField;
using observability::StringField;

namespace {

std::int64_t EnvSeconds(const char* name, std::int64_t fallback) {
  const char* raw = std::getenv(name);
  if (!raw || !*raw) {
    return fallback;
  }
  char*      end   = nullptr;
  const auto value = std::strtoll(raw, &end, 10);
  if (*end != '\0' || value <= 0) {
    PLANNER_LOG_WARN("Ignoring invalid liveness override", {StringField("name", name), StringField("value", raw)});
    return fallback;
  }
  return value;
}

} // namespace

LivenessThresholds ReadThresholds(std::int64_t default_unresponsive_secs, std::int64_t default_stale_secs) {
  LivenessThresholds thresholds;
  thresholds.unresponsive_secs = EnvSeconds("PLANNING_SESSIOND_UNRESPONSIVE_SECS", default_unresponsive_secs);
  thresholds.stale_secs        = EnvSeconds("PLANNING_SESSIOND_STALE_SECS", default_stale_secs);
  return thresholds;
}

v1::LivenessState ClassifyLiveness(const v1::SessionRecord& record, const LivenessThresholds& thresholds, util::TimePoint now) {
  if (record.liveness() == v1::LIVENESS_STATE_STOPPED) {
    return v1::LIVENESS_STATE_STOPPED;
  }
  const auto elapsed = util::ElapsedSeconds(record.last_heartbeat_at(), now);
  if (elapsed > thresholds.stale_secs) {
    return v1::LIVENESS_STATE_STOPPED;
  }
  if (elapsed > thresholds.unresponsive_secs) {
    return v1::LIVENESS_STATE_UNRESPONSIVE;
  }
  return record.liveness();
}

SessionRegistry::SessionRegistry(std::filesystem::path registry_file, std::string build_sha, ThresholdsProvider thresholds)
    : registry_file_(std::move(registry_file)), build_sha_(std::move(build_sha)), thresholds_(std::move(thresholds)) {
}

void SessionRegistry::SetChangeListener(ChangeListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

void SessionRegistry::Load() {
  std::lock_guard lock(mutex_);
  sessions_.clear();

  std::error_code ec;
  if (!std::filesystem::exists(registry_file_, ec)) {
    return;
  }

  v1::SessionRegistryFile file;
  try {
    // the file holds a bare array
    util::FromJson("{\"sessions\":" + util::ReadFile(registry_file_) + "}", &file);
  } catch (const std::exception& e) {
    PLANNER_LOG_WARN("Discarding unreadable session registry", {StringField("path", registry_file_.string()), StringField("error", e.what())});
    return;
  }

  Sessions loaded;
  for (auto& record : *file.mutable_sessions()) {
    // the previous daemon's sessions must re-register
    record.set_liveness(v1::LIVENESS_STATE_STOPPED);
    loaded[record.workflow_session_id()] = record;
  }
  CommitLocked(std::move(loaded));

  PLANNER_LOG_INFO("Session registry loaded", {IntField("sessions", static_cast<std::int64_t>(sessions_.size()))});
}

void SessionRegistry::PersistLocked(const Sessions& sessions) const {
  std::string json = "[";
  bool        first = true;
  for (const auto& [id, record] : sessions) {
    json += first ? "\n  " : ",\n  ";
    json += util::ToJson(record);
    first = false;
  }
  json += sessions.empty() ? "]\n" : "\n]\n";

  try {
    util::WriteFileAtomic(registry_file_, json);
  } catch (const std::exception& e) {
    throw util::Internal(std::string("failed to persist session registry: ") + e.what());
  }
  observability::Metrics::Instance().SetRegisteredSessions(static_cast<std::int64_t>(sessions.size()));
}

void SessionRegistry::CommitLocked(Sessions next) {
  // memory only moves once the file holds the new state
  PersistLocked(next);
  sessions_.swap(next);
}

void SessionRegistry::Persist() {
  std::lock_guard lock(mutex_);
  PersistLocked(sessions_);
}

void SessionRegistry::CheckAcceptingLocked() const {
  if (shutting_down_) {
    throw util::ShuttingDown();
  }
}

void SessionRegistry::Notify(const std::vector<v1::SessionRecord>& changed) {
  ChangeListener listener;
  {
    std::lock_guard lock(mutex_);
    listener = listener_;
  }
  if (!listener) return;
  for (const auto& record : changed) {
    listener(record);
  }
}

std::string SessionRegistry::Register(v1::SessionRecord record) {
  {
    std::lock_guard lock(mutex_);
    CheckAcceptingLocked();

    const auto& id = record.workflow_session_id();
    auto        it = sessions_.find(id);
    if (it != sessions_.end() && it->second.pid() != record.pid() && it->second.liveness() != v1::LIVENESS_STATE_STOPPED) {
      throw util::AlreadyRegistered(id, it->second.pid());
    }

    const auto now                      = util::ToProto(util::Now());
    *record.mutable_updated_at()        = now;
    *record.mutable_last_heartbeat_at() = now;
    record.set_liveness(v1::LIVENESS_STATE_RUNNING);

    auto next = sessions_;
    next[id]  = record;
    CommitLocked(std::move(next));
  }

  PLANNER_LOG_INFO("Session registered", {StringField("session_id", record.workflow_session_id()), IntField("pid", record.pid())});
  Notify({record});
  return build_sha_;
}

std::string SessionRegistry::Update(const v1::SessionRecord& record) {
  v1::SessionRecord changed;
  {
    std::lock_guard lock(mutex_);
    CheckAcceptingLocked();

    const auto& id  = record.workflow_session_id();
    const auto  now = util::ToProto(util::Now());
    auto        it  = sessions_.find(id);

    if (it == sessions_.end()) {
      changed                              = record;
      *changed.mutable_updated_at()        = now;
      *changed.mutable_last_heartbeat_at() = now;
      if (changed.liveness() != v1::LIVENESS_STATE_STOPPED) changed.set_liveness(v1::LIVENESS_STATE_RUNNING);
    } else if (it->second.pid() != record.pid()) {
      PLANNER_LOG_WARN("Ignoring update from foreign pid",
                       {StringField("session_id", id), IntField("pid", record.pid()), IntField("owner_pid", it->second.pid())});
      return build_sha_;
    } else {
      changed = it->second;
      changed.set_phase(record.phase());
      changed.set_iteration(record.iteration());
      changed.set_workflow_status(record.workflow_status());
      *changed.mutable_updated_at()        = now;
      *changed.mutable_last_heartbeat_at() = now;
      changed.set_liveness(record.liveness() == v1::LIVENESS_STATE_STOPPED ? v1::LIVENESS_STATE_STOPPED : v1::LIVENESS_STATE_RUNNING);
    }

    auto next = sessions_;
    next[id]  = changed;
    CommitLocked(std::move(next));
  }

  Notify({changed});
  return build_sha_;
}

void SessionRegistry::Heartbeat(const std::string& session_id) {
  v1::SessionRecord changed;
  bool              liveness_changed = false;
  {
    std::lock_guard lock(mutex_);
    CheckAcceptingLocked();

    auto it = sessions_.find(session_id);
    // a stopped record no longer counts as registered; the owner has to
    // register again
    if (it == sessions_.end() || it->second.liveness() == v1::LIVENESS_STATE_STOPPED) {
      throw util::SessionNotFound(session_id);
    }

    changed                              = it->second;
    *changed.mutable_last_heartbeat_at() = util::ToProto(util::Now());
    if (changed.liveness() == v1::LIVENESS_STATE_UNRESPONSIVE) {
      changed.set_liveness(v1::LIVENESS_STATE_RUNNING);
      liveness_changed = true;
    }

    auto next        = sessions_;
    next[session_id] = changed;
    CommitLocked(std::move(next));
  }

  if (liveness_changed) {
    Notify({changed});
  }
}

std::vector<v1::SessionRecord> SessionRegistry::List() {
  try {
    SweepAndNotify(util::Now());
  } catch (const util::Internal& e) {
    // list what is known; the sweeper retries on its next tick
    PLANNER_LOG_WARN("Liveness sweep before list failed", {StringField("error", e.what())});
  }
  return Records();
}

std::vector<v1::SessionRecord> SessionRegistry::Records() const {
  std::lock_guard                lock(mutex_);
  std::vector<v1::SessionRecord> records;
  records.reserve(sessions_.size());
  for (const auto& [id, record] : sessions_) {
    records.push_back(record);
  }
  return records;
}

v1::SessionRecord SessionRegistry::ForceStop(const std::string& session_id) {
  v1::SessionRecord removed;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      throw util::SessionNotFound(session_id);
    }
    removed = it->second;

    auto next = sessions_;
    next.erase(session_id);
    CommitLocked(std::move(next));
  }

  removed.set_liveness(v1::LIVENESS_STATE_STOPPED);
  *removed.mutable_updated_at() = util::ToProto(util::Now());

  PLANNER_LOG_INFO("Session force-stopped", {StringField("session_id", session_id)});
  Notify({removed});
  return removed;
}

std::vector<v1::SessionRecord> SessionRegistry::Sweep(util::TimePoint now) {
  const auto thresholds = thresholds_ ? thresholds_() : LivenessThresholds{};

  std::vector<v1::SessionRecord> changed;
  std::lock_guard                lock(mutex_);
  auto                           next = sessions_;
  for (auto& [id, record] : next) {
    if (record.liveness() == v1::LIVENESS_STATE_STOPPED) continue;

    const auto liveness = ClassifyLiveness(record, thresholds, now);
    if (liveness == record.liveness()) continue;

    record.set_liveness(liveness);
    *record.mutable_updated_at() = util::ToProto(now);
    changed.push_back(record);
  }
  if (changed.empty()) {
    return changed;
  }

  CommitLocked(std::move(next));
  for (const auto& record : changed) {
    PLANNER_LOG_INFO("Session liveness changed",
                     {StringField("session_id", record.workflow_session_id()), StringField("liveness", v1::LivenessState_Name(record.liveness()))});
  }
  return changed;
}

void SessionRegistry::SweepAndNotify(util::TimePoint now) {
  Notify(Sweep(now));
}

bool SessionRegistry::MarkShuttingDown() {
  std::lock_guard lock(mutex_);
  const bool      already = shutting_down_;
  shutting_down_          = true;
  return already;
}

bool SessionRegistry::ShuttingDown() const {
  std::lock_guard lock(mutex_);
  return shutting_down_;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

} // namespace planner::daemon
