#include "internal/daemon/session_registry.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace {

using planner::daemon::LivenessThresholds;
using planner::daemon::SessionRegistry;
using planner::v1::SessionRecord;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "planner_registry_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

SessionRegistry MakeRegistry(const std::filesystem::path& dir) {
  return SessionRegistry(dir / "sessions.json", "sha-test", [] { return LivenessThresholds{}; });
}

SessionRecord Record(const std::string& id, std::uint32_t pid) {
  SessionRecord record;
  record.set_workflow_session_id(id);
  record.set_feature_name("feature-" + id);
  record.set_working_dir("/work/" + id);
  record.set_phase("Planning");
  record.set_pid(pid);
  return record;
}

void TestLivenessFollowsHeartbeatAge() {
  LivenessThresholds thresholds;
  SessionRecord      record = Record("a", 1);
  const auto         start  = planner::util::Now();
  *record.mutable_last_heartbeat_at() = planner::util::ToProto(start);

  using std::chrono::seconds;
  assert(planner::daemon::ClassifyLiveness(record, thresholds, start + seconds(25)) == planner::v1::LIVENESS_STATE_RUNNING);
  assert(planner::daemon::ClassifyLiveness(record, thresholds, start + seconds(26)) == planner::v1::LIVENESS_STATE_UNRESPONSIVE);
  assert(planner::daemon::ClassifyLiveness(record, thresholds, start + seconds(61)) == planner::v1::LIVENESS_STATE_STOPPED);

  record.set_liveness(planner::v1::LIVENESS_STATE_STOPPED);
  assert(planner::daemon::ClassifyLiveness(record, thresholds, start) == planner::v1::LIVENESS_STATE_STOPPED);
}

void TestSweepAndHeartbeat() {
  const auto dir      = TestDir("sweep");
  auto       registry = MakeRegistry(dir);

  std::vector<SessionRecord> notified;
  registry.SetChangeListener([&](const SessionRecord& record) { notified.push_back(record); });

  assert(registry.Register(Record("s1", 100)) == "sha-test");
  assert(notified.size() == 1);

  const auto now     = planner::util::Now();
  auto       changed = registry.Sweep(now + std::chrono::seconds(26));
  assert(changed.size() == 1);
  assert(changed[0].liveness() == planner::v1::LIVENESS_STATE_UNRESPONSIVE);

  // a heartbeat revives an unresponsive session
  registry.Heartbeat("s1");
  assert(notified.size() == 2);
  assert(notified.back().liveness() == planner::v1::LIVENESS_STATE_RUNNING);

  registry.SweepAndNotify(planner::util::Now() + std::chrono::seconds(61));
  assert(notified.back().liveness() == planner::v1::LIVENESS_STATE_STOPPED);

  // but not a stopped one; its owner is told to register again
  bool threw = false;
  try {
    registry.Heartbeat("s1");
  } catch (const planner::util::SessionNotFound&) {
    threw = true;
  }
  assert(threw);
  assert(registry.List()[0].liveness() == planner::v1::LIVENESS_STATE_STOPPED);
  assert(registry.Sweep(planner::util::Now() + std::chrono::seconds(120)).empty());

  registry.Register(Record("s1", 100));
  assert(registry.List()[0].liveness() == planner::v1::LIVENESS_STATE_RUNNING);
  registry.Heartbeat("s1");
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFailedWriteLeavesRegistryUnchanged() {
  const auto dir = TestDir("failed_write");

  // the registry's parent directory is a regular file
  planner::util::WriteFileAtomic(dir / "blocked", "not a directory");
  SessionRegistry blocked(dir / "blocked" / "sessions.json", "sha-test", [] { return LivenessThresholds{}; });

  std::vector<SessionRecord> notified;
  blocked.SetChangeListener([&](const SessionRecord& record) { notified.push_back(record); });

  assert(Throws<planner::util::Internal>([&] { blocked.Register(Record("s1", 100)); }));
  assert(blocked.Size() == 0);
  assert(blocked.List().empty());
  assert(Throws<planner::util::Internal>([&] { blocked.Update(Record("s2", 100)); }));
  assert(blocked.Size() == 0);
  assert(notified.empty());

  // a registry that loses its directory after registering keeps its records
  const auto state = dir / "state";
  SessionRegistry registry(state / "sessions.json", "sha-test", [] { return LivenessThresholds{}; });
  registry.SetChangeListener([&](const SessionRecord& record) { notified.push_back(record); });
  registry.Register(Record("s1", 100));
  notified.clear();

  std::filesystem::remove_all(state);
  planner::util::WriteFileAtomic(state, "not a directory");

  auto own = Record("s1", 100);
  own.set_phase("Reviewing");
  assert(Throws<planner::util::Internal>([&] { registry.Update(own); }));
  assert(Throws<planner::util::Internal>([&] { registry.ForceStop("s1"); }));
  assert(Throws<planner::util::Internal>([&] { registry.Sweep(planner::util::Now() + std::chrono::seconds(61)); }));
  assert(Throws<planner::util::Internal>([&] { registry.Heartbeat("s1"); }));
  assert(notified.empty());

  // list still answers from memory
  const auto records = registry.List();
  assert(records.size() == 1);
  assert(records[0].phase() == "Planning");
  assert(records[0].liveness() == planner::v1::LIVENESS_STATE_RUNNING);

  std::filesystem::remove(state);
  registry.Update(own);
  assert(registry.List()[0].phase() == "Reviewing");
  assert(std::filesystem::exists(state / "sessions.json"));
}

void TestRegistryIsWrittenThrough() {
  const auto dir = TestDir("write_through");
  {
    auto registry = MakeRegistry(dir);
    registry.Register(Record("s1", 100));
    registry.Register(Record("s2", 200));
    assert(std::filesystem::exists(dir / "sessions.json"));
  }

  // a new daemon reloads every session as stopped
  auto reloaded = MakeRegistry(dir);
  reloaded.Load();
  const auto records = reloaded.List();
  assert(records.size() == 2);
  assert(records[0].workflow_session_id() == "s1");
  assert(records[1].feature_name() == "feature-s2");
  for (const auto& record : records) {
    assert(record.liveness() == planner::v1::LIVENESS_STATE_STOPPED);
  }

  // so the same session may now re-register from another process
  reloaded.Register(Record("s1", 300));
  assert(reloaded.List()[0].pid() == 300);
  assert(reloaded.List()[0].liveness() == planner::v1::LIVENESS_STATE_RUNNING);
}

void TestUnreadableRegistryIsDiscarded() {
  const auto dir = TestDir("unreadable");
  planner::util::WriteFileAtomic(dir / "sessions.json", "{not an array");

  auto registry = MakeRegistry(dir);
  registry.Load();
  assert(registry.Size() == 0);
}

void TestRegisterConflictsAndUnknownSessions() {
  const auto dir      = TestDir("conflicts");
  auto       registry = MakeRegistry(dir);
  registry.Register(Record("s1", 100));

  bool threw = false;
  try {
    registry.Register(Record("s1", 101));
  } catch (const planner::util::AlreadyRegistered&) {
    threw = true;
  }
  assert(threw);

  // the owner may register again
  registry.Register(Record("s1", 100));

  threw = false;
  try {
    registry.Heartbeat("missing");
  } catch (const planner::util::SessionNotFound&) {
    threw = true;
  }
  assert(threw);

  // updates from another pid leave the record alone
  auto foreign = Record("s1", 999);
  foreign.set_phase("Reviewing");
  registry.Update(foreign);
  assert(registry.List()[0].phase() == "Planning");

  auto own = Record("s1", 100);
  own.set_phase("Reviewing");
  own.set_iteration(2);
  registry.Update(own);
  assert(registry.List()[0].phase() == "Reviewing");
  assert(registry.List()[0].iteration() == 2);
}

void TestForceStopRemovesRecord() {
  const auto dir      = TestDir("force_stop");
  auto       registry = MakeRegistry(dir);
  registry.Register(Record("s1", 100));

  const auto removed = registry.ForceStop("s1");
  assert(removed.liveness() == planner::v1::LIVENESS_STATE_STOPPED);
  assert(registry.Size() == 0);

  bool threw = false;
  try {
    registry.ForceStop("s1");
  } catch (const planner::util::SessionNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestShuttingDownRejectsMutations() {
  const auto dir      = TestDir("shutting_down");
  auto       registry = MakeRegistry(dir);
  registry.Register(Record("s1", 100));
  assert(!registry.MarkShuttingDown());
  assert(registry.ShuttingDown());
  assert(registry.MarkShuttingDown());

  bool threw = false;
  try {
    registry.Register(Record("s2", 100));
  } catch (const planner::util::ShuttingDown&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Heartbeat("s1");
  } catch (const planner::util::ShuttingDown&) {
    threw = true;
  }
  assert(threw);
  assert(registry.List().size() == 1);
}

void TestThresholdOverridesAreReadEachTime() {
  ::unsetenv("PLANNING_SESSIOND_UNRESPONSIVE_SECS");
  ::unsetenv("PLANNING_SESSIOND_STALE_SECS");
  auto thresholds = planner::daemon::ReadThresholds(25, 60);
  assert(thresholds.unresponsive_secs == 25 && thresholds.stale_secs == 60);

  ::setenv("PLANNING_SESSIOND_UNRESPONSIVE_SECS", "2", 1);
  ::setenv("PLANNING_SESSIOND_STALE_SECS", "5", 1);
  thresholds = planner::daemon::ReadThresholds(25, 60);
  assert(thresholds.unresponsive_secs == 2 && thresholds.stale_secs == 5);

  ::setenv("PLANNING_SESSIOND_STALE_SECS", "soon", 1);
  assert(planner::daemon::ReadThresholds(25, 60).stale_secs == 60);

  const auto dir = TestDir("env_override");
  SessionRegistry registry(dir / "sessions.json", "sha-test", [] { return planner::daemon::ReadThresholds(25, 60); });
  registry.Register(Record("s1", 100));
  auto changed = registry.Sweep(planner::util::Now() + std::chrono::seconds(3));
  assert(changed.size() == 1 && changed[0].liveness() == planner::v1::LIVENESS_STATE_UNRESPONSIVE);

  ::unsetenv("PLANNING_SESSIOND_UNRESPONSIVE_SECS");
  ::unsetenv("PLANNING_SESSIOND_STALE_SECS");
}

} // namespace

int main() {
  TestLivenessFollowsHeartbeatAge();
  TestSweepAndHeartbeat();
  TestFailedWriteLeavesRegistryUnchanged();
  TestRegistryIsWrittenThrough();
  TestUnreadableRegistryIsDiscarded();
  TestRegisterConflictsAndUnknownSessions();
  TestForceStopRemovesRecord();
  TestShuttingDownRejectsMutations();
  TestThresholdOverridesAreReadEachTime();

  std::cout << "planner_unit_session_registry: pass\n";
  return 0;
}
