#include "internal/view/workflow_view.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "internal/store/file_event_store.hpp"
#include "internal/view/broadcast.hpp"
#include "internal/view/latest_value.hpp"

namespace {

using planner::v1::WorkflowCommand;
using planner::v1::WorkflowView;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "planner_workflow_view_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// Commits each command and folds the produced events into `view`.
void Drive(planner::store::FileEventStore* store, planner::store::AggregateContext* context, WorkflowView* view, const std::string& id,
           const WorkflowCommand& command) {
  auto events = context->aggregate.Handle(command, planner::util::Now());
  auto seq    = context->current_sequence;
  store->Commit(id, context, events);
  for (const auto& event : events) {
    planner::view::ApplyToView(view, id, event, ++seq);
  }
}

void TestBootstrapMatchesLiveProjection() {
  const auto dir = TestDir("bootstrap");
  const auto id  = std::string("wf-view");

  planner::store::FileEventStore   store(planner::store::EventLogPath(dir, id), planner::store::SnapshotPath(dir, id), 0);
  planner::store::AggregateContext context;
  WorkflowView                     live;

  WorkflowCommand create;
  create.mutable_create_workflow()->set_feature_name("view");
  create.mutable_create_workflow()->set_max_iterations(1);
  Drive(&store, &context, &live, id, create);
  assert(live.state() == planner::v1::LIFECYCLE_STATE_PLANNING);
  assert(planner::view::CurrentUiMode(live) == planner::view::UiMode::kPlanning);
  assert(planner::view::ShouldContinue(live));

  WorkflowCommand completed;
  completed.mutable_planning_completed();
  Drive(&store, &context, &live, id, completed);

  WorkflowCommand cycle;
  cycle.mutable_review_cycle_started()->add_reviewers("claude");
  Drive(&store, &context, &live, id, cycle);

  WorkflowCommand rejected;
  rejected.mutable_reviewer_rejected()->set_reviewer_id("claude");
  Drive(&store, &context, &live, id, rejected);

  WorkflowCommand done;
  done.mutable_review_cycle_completed()->set_approved(false);
  Drive(&store, &context, &live, id, done);
  assert(live.state() == planner::v1::LIFECYCLE_STATE_AWAITING_PLANNING_DECISION);
  assert(live.last_event_type() == "PlanningMaxIterationsReached");

  WorkflowCommand declined;
  declined.mutable_user_declined()->set_feedback("cover the migration");
  Drive(&store, &context, &live, id, declined);
  assert(live.user_feedback_history_size() == 1);
  assert(live.user_feedback_history(0) == "cover the migration");

  // malformed lines are skipped, not fatal
  {
    std::ofstream out(store.log_path(), std::ios::app);
    out << "garbage line\n";
  }

  const auto rebuilt = planner::view::BootstrapViewFromEvents(store.log_path(), id);
  assert(rebuilt.last_event_sequence() == context.current_sequence);
  assert(rebuilt.last_event_sequence() == live.last_event_sequence());
  assert(rebuilt.state() == live.state());
  assert(rebuilt.user_feedback_history_size() == 1);
  assert(rebuilt.aggregate().data().max_iterations() == 2);
}

void TestMissingLogYieldsEmptyView() {
  const auto view = planner::view::BootstrapViewFromEvents(TestDir("missing") / "none.events.jsonl", "wf-none");
  assert(view.workflow_id() == "wf-none");
  assert(view.last_event_sequence() == 0);
  assert(view.state() == planner::v1::LIFECYCLE_STATE_UNINITIALIZED);
  assert(!planner::view::ShouldContinue(view));
  assert(!planner::view::HasFailure(view));
}

void TestUiModeFollowsLifecycle() {
  WorkflowView view;
  view.mutable_aggregate()->mutable_data();

  view.set_state(planner::v1::LIFECYCLE_STATE_IMPLEMENTATION_REVIEW);
  assert(planner::view::CurrentUiMode(view) == planner::view::UiMode::kImplementation);
  assert(planner::view::UiModeName(planner::view::CurrentUiMode(view)) == "Implementation");

  view.set_state(planner::v1::LIFECYCLE_STATE_CANCELLED);
  assert(planner::view::CurrentUiMode(view) == planner::view::UiMode::kComplete);
  assert(!planner::view::ShouldContinue(view));

  view.mutable_aggregate()->mutable_data()->mutable_last_failure()->set_message("timeout");
  assert(planner::view::HasFailure(view));
}

void TestLatestValueKeepsOnlyNewest() {
  planner::view::LatestValue<int> slot(0);
  assert(slot.Publish(1) == 1);
  assert(slot.Publish(2) == 2);
  assert(slot.Get() == 2);

  assert(!slot.WaitForChange(2, std::chrono::milliseconds(10)));

  std::thread writer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    slot.Publish(7);
  });
  auto changed = slot.WaitForChange(2, std::chrono::seconds(2));
  writer.join();
  assert(changed && changed->first == 7 && changed->second == 3);
}

void TestBroadcastDropsOldestWhenFull() {
  planner::view::Broadcast<int> channel(2);
  auto                          fast = channel.Subscribe();
  auto                          slow = channel.Subscribe();

  channel.Publish(1);
  assert(fast->TryNext() == 1);

  channel.Publish(2);
  channel.Publish(3);
  assert(slow->Lagged() == 1);
  assert(slow->TryNext() == 2);
  assert(slow->TryNext() == 3);
  assert(!slow->TryNext());
  assert(fast->Lagged() == 0);

  fast.reset();
  channel.Publish(4);
  assert(channel.SubscriberCount() == 1);
  assert(slow->Next(std::chrono::milliseconds(100)) == 4);
}

} // namespace

int main() {
  TestBootstrapMatchesLiveProjection();
  TestMissingLogYieldsEmptyView();
  TestUiModeFollowsLifecycle();
  TestLatestValueKeepsOnlyNewest();
  TestBroadcastDropsOldestWhenFull();

  std::cout << "planner_unit_workflow_view: pass\n";
  return 0;
}
