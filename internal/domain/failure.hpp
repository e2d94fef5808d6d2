#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/util/time.hpp"
#include "planner/v1/types.pb.h"

namespace planner::domain {

/*
  Failure taxonomy and recovery policy.

  The aggregate only records failures. The orchestration around it asks
  DecideRecovery what to do next.
*/

constexpr std::uint32_t kDefaultMaxRetries  = 2;
constexpr std::uint64_t kDefaultBackoffSecs = 5;
constexpr std::uint64_t kMaxBackoffSecs     = 300;

v1::FailureKind MakeFailureKind(v1::FailureKindType type, std::int32_t exit_code = 0, std::string_view detail = {});

bool             IsRetryable(const v1::FailureKind& kind);
std::string_view DisplayName(const v1::FailureKind& kind);

// Network when the text looks like a connectivity problem, else Unknown(text).
v1::FailureKind ClassifyErrorMessage(std::string_view text);

v1::FailureContext NewFailure(const v1::FailureKind& kind, std::string_view message, v1::PhaseLabel phase, std::string_view agent_name,
                              std::uint32_t max_retries, util::TimePoint now);

bool CanRetry(const v1::FailureContext& failure);

// Unset policy fields fall back to the defaults above.
v1::FailurePolicy  NormalizePolicy(const v1::FailurePolicy& policy);
v1::RecoveryAction DecideRecovery(const v1::FailurePolicy& policy, const v1::FailureContext& failure);

// backoff_secs * 2^retry_count, capped at kMaxBackoffSecs.
std::chrono::seconds BackoffFor(const v1::FailurePolicy& policy, std::uint32_t retry_count);

// Appends and evicts the oldest entries beyond kMaxFailureHistory.
void AppendFailure(google::protobuf::RepeatedPtrField<v1::FailureContext>* history, const v1::FailureContext& failure);

} // namespace planner::domain
