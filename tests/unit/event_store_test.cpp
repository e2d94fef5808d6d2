#include "internal/store/file_event_store.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"

namespace {

using planner::store::AggregateContext;
using planner::store::FileEventStore;
using planner::v1::WorkflowCommand;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "planner_event_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

FileEventStore StoreFor(const std::filesystem::path& dir, const std::string& id, std::uint32_t snapshot_every) {
  return FileEventStore(planner::store::EventLogPath(dir, id), planner::store::SnapshotPath(dir, id), snapshot_every);
}

void Execute(FileEventStore* store, const std::string& id, AggregateContext* context, const WorkflowCommand& command) {
  auto events = context->aggregate.Handle(command, planner::util::Now());
  store->Commit(id, context, events, {{"command", "test"}});
}

std::vector<WorkflowCommand> PlanningScript() {
  std::vector<WorkflowCommand> script(8);
  script[0].mutable_create_workflow()->set_feature_name("store");
  script[0].mutable_create_workflow()->set_max_iterations(3);
  script[1].mutable_start_planning();
  script[2].mutable_planning_completed()->set_plan_path("plan.md");
  script[3].mutable_review_cycle_started()->add_reviewers("claude");
  script[4].mutable_reviewer_rejected()->set_reviewer_id("claude");
  script[5].mutable_review_cycle_completed()->set_approved(false);
  script[6].mutable_revising_started()->set_feedback_summary("more detail");
  script[7].mutable_revision_completed();
  return script;
}

void TestSequencesStartAtOneAndHaveNoGaps() {
  const auto       dir   = TestDir("sequences");
  const auto       id    = std::string("wf-seq");
  auto             store = StoreFor(dir, id, 0);
  AggregateContext context;

  for (const auto& cmd : PlanningScript()) Execute(&store, id, &context, cmd);

  const auto events = store.LoadEvents(id);
  assert(!events.empty());
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence() == i + 1);
    assert(events[i].event_version() == "1");
    assert(events[i].metadata().at("command") == "test");
  }
  assert(context.current_sequence == events.size());
}

void TestSnapshotPlusTailMatchesFullReplay() {
  const auto dir = TestDir("snapshot_equivalence");
  const auto id  = std::string("wf-snap");

  auto             store = StoreFor(dir, id, 3);
  AggregateContext context;
  for (const auto& cmd : PlanningScript()) Execute(&store, id, &context, cmd);
  assert(std::filesystem::exists(store.snapshot_path()));

  // same log, no snapshot
  FileEventStore replay_only(store.log_path(), dir / "absent.snapshot.json", 0);

  const auto from_snapshot = store.LoadAggregate(id);
  const auto from_scratch  = replay_only.LoadAggregate(id);

  assert(from_snapshot.current_sequence == from_scratch.current_sequence);
  assert(from_snapshot.current_sequence == context.current_sequence);
  assert(google::protobuf::util::MessageDifferencer::Equals(from_snapshot.aggregate.Snapshot(), from_scratch.aggregate.Snapshot()));
  assert(google::protobuf::util::MessageDifferencer::Equals(from_scratch.aggregate.Snapshot(), context.aggregate.Snapshot()));
}

void TestSharedLogDetectsConcurrencyConflict() {
  const auto dir = TestDir("conflict");
  const auto id  = std::string("wf-shared");

  auto first  = StoreFor(dir, id, 0);
  auto second = StoreFor(dir, id, 0);

  auto script = PlanningScript();

  AggregateContext a = first.LoadAggregate(id);
  AggregateContext b = second.LoadAggregate(id);
  Execute(&first, id, &a, script[0]);

  bool threw = false;
  try {
    Execute(&second, id, &b, script[0]);
  } catch (const planner::util::ConcurrencyConflict&) {
    threw = true;
  }
  assert(threw && "stale context must not append");
  assert(first.LoadEvents(id).size() == 1);

  // a reload resolves the conflict
  b = second.LoadAggregate(id);
  Execute(&second, id, &b, script[1]);
  assert(second.LoadEvents(id).size() == 2);
}

void TestForeignSnapshotIsIgnored() {
  const auto dir = TestDir("foreign_snapshot");
  const auto id  = std::string("wf-mine");

  auto             store = StoreFor(dir, id, 0);
  AggregateContext context;
  auto             script = PlanningScript();
  Execute(&store, id, &context, script[0]);
  Execute(&store, id, &context, script[1]);

  planner::v1::StoredSnapshot foreign;
  foreign.set_aggregate_id("wf-other");
  foreign.set_sequence(99);
  foreign.mutable_state()->mutable_data()->set_feature_name("not mine");
  planner::util::WriteFileAtomic(store.snapshot_path(), planner::util::ToJson(foreign));

  const auto loaded = store.LoadAggregate(id);
  assert(loaded.current_sequence == 2);
  assert(loaded.aggregate.Snapshot().data().feature_name() == "store");
}

void TestLogIsFilteredByAggregate() {
  const auto dir = TestDir("filter");
  const auto log = dir / "shared.events.jsonl";

  FileEventStore   left(log, dir / "left.snapshot.json", 0);
  FileEventStore   right(log, dir / "right.snapshot.json", 0);
  AggregateContext l;
  AggregateContext r;
  auto             script = PlanningScript();

  Execute(&left, "left", &l, script[0]);
  Execute(&right, "right", &r, script[0]);
  Execute(&left, "left", &l, script[1]);

  assert(left.LoadEvents("left").size() == 2);
  assert(right.LoadEvents("right").size() == 1);
  assert(right.LoadEvents("right")[0].sequence() == 1);
}

void TestMalformedLineIsStorageFailure() {
  const auto dir   = TestDir("malformed");
  const auto id    = std::string("wf-bad");
  auto       store = StoreFor(dir, id, 0);

  std::ofstream out(store.log_path());
  out << "{not json\n";
  out.close();

  bool threw = false;
  try {
    (void)store.LoadEvents(id);
  } catch (const planner::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestUnterminatedTailIsDroppedBeforeAppend() {
  const auto       dir   = TestDir("unterminated_tail");
  const auto       id    = std::string("wf");
  auto             store = StoreFor(dir, id, 0);
  AggregateContext context;
  auto             script = PlanningScript();
  Execute(&store, id, &context, script[0]);

  // a writer died halfway through its line
  {
    std::ofstream out(store.log_path(), std::ios::app);
    out << "{\"aggregateId\":\"wf\",\"seq";
  }

  // readers skip the fragment
  assert(store.LoadEvents(id).size() == 1);
  context = store.LoadAggregate(id);
  assert(context.current_sequence == 1);

  Execute(&store, id, &context, script[1]);
  assert(context.current_sequence == 2);

  FileEventStore fresh = StoreFor(dir, id, 0);
  const auto     events = fresh.LoadEvents(id);
  assert(events.size() == 2);
  assert(events[0].sequence() == 1);
  assert(events[1].sequence() == 2);

  const auto text = planner::util::ReadFile(store.log_path());
  assert(text.back() == '\n');
  assert(text.find("\"seq{") == std::string::npos);
}

void TestCachedSequenceSeesOtherWriters() {
  const auto dir = TestDir("cached_sequence");
  const auto id  = std::string("wf-cache");

  auto first  = StoreFor(dir, id, 0);
  auto second = StoreFor(dir, id, 0);
  auto script = PlanningScript();

  AggregateContext a;
  Execute(&first, id, &a, script[0]);
  Execute(&first, id, &a, script[1]);

  AggregateContext b = second.LoadAggregate(id);
  Execute(&second, id, &b, script[2]);

  // first's cache is behind the log; it must still notice
  bool threw = false;
  try {
    Execute(&first, id, &a, script[2]);
  } catch (const planner::util::ConcurrencyConflict&) {
    threw = true;
  }
  assert(threw);

  a = first.LoadAggregate(id);
  assert(a.current_sequence == 3);
  Execute(&first, id, &a, script[3]);

  const auto events = second.LoadEvents(id);
  assert(events.size() == 4);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence() == i + 1);
  }
}

void TestEmptyCommitWritesNothing() {
  const auto       dir   = TestDir("empty_commit");
  const auto       id    = std::string("wf-empty");
  auto             store = StoreFor(dir, id, 0);
  AggregateContext context;

  assert(store.Commit(id, &context, {}) == 0);
  assert(!std::filesystem::exists(store.log_path()));
  assert(planner::store::ShouldSnapshot(50, 50));
  assert(!planner::store::ShouldSnapshot(49, 50));
  assert(!planner::store::ShouldSnapshot(50, 0));
}

} // namespace

int main() {
  TestSequencesStartAtOneAndHaveNoGaps();
  TestSnapshotPlusTailMatchesFullReplay();
  TestSharedLogDetectsConcurrencyConflict();
  TestForeignSnapshotIsIgnored();
  TestLogIsFilteredByAggregate();
  TestMalformedLineIsStorageFailure();
  TestUnterminatedTailIsDroppedBeforeAppend();
  TestCachedSequenceSeesOtherWriters();
  TestEmptyCommitWritesNothing();

  std::cout << "planner_unit_event_store: pass\n";
  return 0;
}
