#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "planner/v1/session.pb.h"

namespace planner::daemon {

struct LivenessThresholds {
  std::int64_t unresponsive_secs = 25;
  std::int64_t stale_secs        = 60;
};

// PLANNING_SESSIOND_UNRESPONSIVE_SECS / PLANNING_SESSIOND_STALE_SECS,
// falling back to the given values. Read on every call.
LivenessThresholds ReadThresholds(std::int64_t default_unresponsive_secs, std::int64_t default_stale_secs);

// Liveness implied by the heartbeat age. Stopped is sticky.
v1::LivenessState ClassifyLiveness(const v1::SessionRecord& record, const LivenessThresholds& thresholds, util::TimePoint now);

/*
  SessionRegistry

  In-memory map of session records, written through to the registry file
  on every mutation while the lock is still held. A mutation whose write
  fails leaves the map untouched. Change listeners run after the lock is
  released.
*/
class SessionRegistry {
 public:
  using ChangeListener     = std::function<void(const v1::SessionRecord&)>;
  using ThresholdsProvider = std::function<LivenessThresholds()>;

  SessionRegistry(std::filesystem::path registry_file, std::string build_sha, ThresholdsProvider thresholds);

  // Reloads persisted records; every one of them is marked Stopped.
  void Load();

  void SetChangeListener(ChangeListener listener);

  std::string Register(v1::SessionRecord record);
  std::string Update(const v1::SessionRecord& record);
  // SessionNotFound for unknown and for Stopped records.
  void Heartbeat(const std::string& session_id);

  // Sweeps liveness, then returns all records sorted by id.
  std::vector<v1::SessionRecord> List();
  // As stored, without sweeping.
  std::vector<v1::SessionRecord> Records() const;

  // Removes the record; returns it marked Stopped.
  v1::SessionRecord ForceStop(const std::string& session_id);

  // Returns the records whose liveness changed.
  std::vector<v1::SessionRecord> Sweep(util::TimePoint now);
  void                           SweepAndNotify(util::TimePoint now);

  // Returns whether shutdown had already been marked.
  bool MarkShuttingDown();
  bool ShuttingDown() const;
  void Persist();

  std::size_t Size() const;

 private:
  using Sessions = std::map<std::string, v1::SessionRecord>;

  void PersistLocked(const Sessions& sessions) const;
  void CommitLocked(Sessions next);
  void CheckAcceptingLocked() const;
  void Notify(const std::vector<v1::SessionRecord>& changed);

  std::filesystem::path registry_file_;
  std::string           build_sha_;
  ThresholdsProvider    thresholds_;

  mutable std::mutex mutex_;
  Sessions           sessions_;
  bool               shutting_down_ = false;
  ChangeListener     listener_;
};

} // namespace planner::daemon
