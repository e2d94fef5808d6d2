#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/repeated_ptr_field.h>

#include "planner/v1/types.pb.h"

namespace planner::domain {

/*
  Sequential (round-robin) reviewer bookkeeping.

  A cycle invokes every configured reviewer once, in configured order.
  The index advances after each completed review, approved or rejected.
  Approvals are only valid for the plan version they were given on.
*/

using ReviewerList = google::protobuf::RepeatedPtrField<std::string>;

void InitSequentialReview(v1::SequentialReviewState* state);

void StartCycle(v1::SequentialReviewState* state, const ReviewerList& reviewers);
void RecordApproval(v1::SequentialReviewState* state, const std::string& reviewer_id);
void RecordRejection(v1::SequentialReviewState* state, const std::string& reviewer_id);
void IncrementRunCount(v1::SequentialReviewState* state, const std::string& reviewer_id);
void AdvanceReviewer(v1::SequentialReviewState* state);

// New plan revision: approvals from older versions no longer count.
void IncrementVersion(v1::SequentialReviewState* state);

std::optional<std::string> CurrentReviewer(const v1::SequentialReviewState& state);
std::uint32_t              RunCount(const v1::SequentialReviewState& state, const std::string& reviewer_id);
bool                       AllApproved(const v1::SequentialReviewState& state, const ReviewerList& reviewers);
bool                       NeedsCycleStart(const v1::SequentialReviewState& state);
bool                       CycleFinished(const v1::SequentialReviewState& state);

// Verdict implied by the recorded votes: every reviewer voted and approved.
bool VotesApprove(const google::protobuf::RepeatedPtrField<v1::ReviewerResult>& results, const ReviewerList& reviewers);

} // namespace planner::domain
