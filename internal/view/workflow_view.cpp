#include "workflow_view.hpp"

#include <fstream>

#include "internal/domain/messages.hpp"
#include "internal/domain/types.hpp"
#include "internal/domain/workflow_aggregate.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace planner::view {

using observability::IntField;
using observability::StringField;

void ApplyToView(v1::WorkflowView* view, const std::string& aggregate_id, const v1::WorkflowEvent& event, std::uint64_t sequence) {
  domain::ApplyEvent(view->mutable_aggregate(), event);

  view->set_workflow_id(aggregate_id);
  view->set_last_event_sequence(sequence);
  view->set_last_event_type(domain::EventType(event));

  if (event.has_user_declined() && !event.user_declined().feedback().empty()) {
    view->add_user_feedback_history(event.user_declined().feedback());
  }

  view->set_state(domain::DeriveLifecycle(view->aggregate()));
}

v1::WorkflowView BootstrapViewFromEvents(const std::filesystem::path& log_path, const std::string& aggregate_id) {
  v1::WorkflowView view;
  view.set_workflow_id(aggregate_id);

  std::ifstream in(log_path);
  if (!in) {
    return view;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    v1::StoredEvent stored;
    try {
      util::FromJson(line, &stored);
    } catch (const std::exception& e) {
      PLANNER_LOG_WARN("Skipping unparseable event line",
                       {StringField("path", log_path.string()), IntField("line", static_cast<std::int64_t>(line_no)), StringField("error", e.what())});
      continue;
    }
    if (stored.aggregate_id() != aggregate_id) continue;

    ApplyToView(&view, aggregate_id, stored.payload(), stored.sequence());
  }
  return view;
}

UiMode CurrentUiMode(const v1::WorkflowView& view) {
  if (domain::IsTerminal(view.state())) {
    return UiMode::kComplete;
  }
  if (domain::IsImplementationState(view.state())) {
    return UiMode::kImplementation;
  }
  return UiMode::kPlanning;
}

std::string_view UiModeName(UiMode mode) {
  switch (mode) {
    case UiMode::kPlanning:
      return "Planning";
    case UiMode::kImplementation:
      return "Implementation";
    case UiMode::kComplete:
      return "Complete";
  }
  return "Planning";
}

bool HasFailure(const v1::WorkflowView& view) {
  return view.aggregate().has_data() && view.aggregate().data().has_last_failure();
}

bool ShouldContinue(const v1::WorkflowView& view) {
  return view.aggregate().has_data() && !domain::IsTerminal(view.state());
}

} // namespace planner::view
