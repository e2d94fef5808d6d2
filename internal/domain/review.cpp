#include "review.hpp"

#include <algorithm>

namespace planner::domain {

void InitSequentialReview(v1::SequentialReviewState* state) {
  state->Clear();
  state->set_plan_version(1);
}

void StartCycle(v1::SequentialReviewState* state, const ReviewerList& reviewers) {
  if (state->plan_version() == 0) {
    state->set_plan_version(1);
  }
  *state->mutable_cycle_order() = reviewers;
  state->set_current_index(0);
}

void RecordApproval(v1::SequentialReviewState* state, const std::string& reviewer_id) {
  (*state->mutable_approvals())[reviewer_id] = state->plan_version();
}

void RecordRejection(v1::SequentialReviewState* state, const std::string& reviewer_id) {
  state->mutable_approvals()->erase(reviewer_id);
  state->set_last_rejecting_reviewer(reviewer_id);
}

void IncrementRunCount(v1::SequentialReviewState* state, const std::string& reviewer_id) {
  (*state->mutable_reviewer_run_counts())[reviewer_id] += 1;
}

void AdvanceReviewer(v1::SequentialReviewState* state) {
  state->set_current_index(state->current_index() + 1);
}

void IncrementVersion(v1::SequentialReviewState* state) {
  state->set_plan_version(state->plan_version() + 1);
  state->mutable_approvals()->clear();
  state->clear_cycle_order();
  state->set_current_index(0);
}

std::optional<std::string> CurrentReviewer(const v1::SequentialReviewState& state) {
  if (state.current_index() >= static_cast<std::uint32_t>(state.cycle_order_size())) {
    return std::nullopt;
  }
  return state.cycle_order(static_cast<int>(state.current_index()));
}

std::uint32_t RunCount(const v1::SequentialReviewState& state, const std::string& reviewer_id) {
  auto it = state.reviewer_run_counts().find(reviewer_id);
  return it == state.reviewer_run_counts().end() ? 0 : it->second;
}

bool AllApproved(const v1::SequentialReviewState& state, const ReviewerList& reviewers) {
  return std::all_of(reviewers.begin(), reviewers.end(), [&](const std::string& id) {
    auto it = state.approvals().find(id);
    return it != state.approvals().end() && it->second == state.plan_version();
  });
}

bool NeedsCycleStart(const v1::SequentialReviewState& state) {
  return state.cycle_order().empty();
}

bool CycleFinished(const v1::SequentialReviewState& state) {
  return !NeedsCycleStart(state) && !CurrentReviewer(state).has_value();
}

bool VotesApprove(const google::protobuf::RepeatedPtrField<v1::ReviewerResult>& results, const ReviewerList& reviewers) {
  if (reviewers.empty()) {
    return false;
  }
  return std::all_of(reviewers.begin(), reviewers.end(), [&](const std::string& id) {
    return std::any_of(results.begin(), results.end(), [&](const v1::ReviewerResult& result) {
      return result.reviewer_id() == id && result.status() == v1::FEEDBACK_STATUS_APPROVED;
    });
  });
}

} // namespace planner::domain
