#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "planner/v1/events.pb.h"
#include "planner/v1/state.pb.h"

namespace planner::view {

// Folds one stored event into the read model.
void ApplyToView(v1::WorkflowView* view, const std::string& aggregate_id, const v1::WorkflowEvent& event, std::uint64_t sequence);

// Rebuilds a view from the event log. Missing file yields an empty view;
// lines that do not parse are skipped with a warning.
v1::WorkflowView BootstrapViewFromEvents(const std::filesystem::path& log_path, const std::string& aggregate_id);

enum class UiMode { kPlanning, kImplementation, kComplete };

UiMode           CurrentUiMode(const v1::WorkflowView& view);
std::string_view UiModeName(UiMode mode);

bool HasFailure(const v1::WorkflowView& view);

// True while the workflow can still make progress.
bool ShouldContinue(const v1::WorkflowView& view);

} // namespace planner::view
