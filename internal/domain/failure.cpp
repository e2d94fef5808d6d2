#include "failure.hpp"

#include <algorithm>
#include <regex>

#include "internal/domain/types.hpp"

namespace planner::domain {

namespace {

const std::regex& NetworkErrorPattern() {
  static const std::regex pattern(R"(connect|network|ECONNREFUSED|ETIMEDOUT|connection\s+refused|name\s+resolution|DNS|socket)",
                                  std::regex::icase | std::regex::ECMAScript);
  return pattern;
}

} // namespace

v1::FailureKind MakeFailureKind(v1::FailureKindType type, std::int32_t exit_code, std::string_view detail) {
  v1::FailureKind kind;
  kind.set_type(type);
  kind.set_exit_code(exit_code);
  kind.set_detail(std::string(detail));
  return kind;
}

bool IsRetryable(const v1::FailureKind& kind) {
  switch (kind.type()) {
    case v1::FAILURE_KIND_TIMEOUT:
    case v1::FAILURE_KIND_NETWORK:
    case v1::FAILURE_KIND_EMPTY_OUTPUT:
    case v1::FAILURE_KIND_ALL_REVIEWERS_FAILED:
      return true;
    default:
      return false;
  }
}

std::string_view DisplayName(const v1::FailureKind& kind) {
  switch (kind.type()) {
    case v1::FAILURE_KIND_TIMEOUT:
      return "Timeout";
    case v1::FAILURE_KIND_NETWORK:
      return "Network";
    case v1::FAILURE_KIND_PROCESS_EXIT:
      return "Process Exit";
    case v1::FAILURE_KIND_PARSE_FAILURE:
      return "Parse Failure";
    case v1::FAILURE_KIND_EMPTY_OUTPUT:
      return "Empty Output";
    case v1::FAILURE_KIND_ALL_REVIEWERS_FAILED:
      return "All Reviewers Failed";
    default:
      return "Unknown";
  }
}

v1::FailureKind ClassifyErrorMessage(std::string_view text) {
  if (std::regex_search(text.begin(), text.end(), NetworkErrorPattern())) {
    return MakeFailureKind(v1::FAILURE_KIND_NETWORK);
  }
  return MakeFailureKind(v1::FAILURE_KIND_UNKNOWN, 0, text);
}

v1::FailureContext NewFailure(const v1::FailureKind& kind, std::string_view message, v1::PhaseLabel phase, std::string_view agent_name,
                              std::uint32_t max_retries, util::TimePoint now) {
  v1::FailureContext failure;
  *failure.mutable_kind() = kind;
  failure.set_message(std::string(message));
  failure.set_phase(phase);
  failure.set_agent_name(std::string(agent_name));
  failure.set_max_retries(max_retries);
  *failure.mutable_failed_at() = util::ToProto(now);
  return failure;
}

bool CanRetry(const v1::FailureContext& failure) {
  return failure.retry_count() < failure.max_retries() && IsRetryable(failure.kind());
}

v1::FailurePolicy NormalizePolicy(const v1::FailurePolicy& policy) {
  v1::FailurePolicy normalized = policy;
  if (!normalized.has_max_retries()) {
    normalized.set_max_retries(kDefaultMaxRetries);
  }
  if (!normalized.has_backoff_secs()) {
    normalized.set_backoff_secs(kDefaultBackoffSecs);
  }
  return normalized;
}

v1::RecoveryAction DecideRecovery(const v1::FailurePolicy& policy, const v1::FailureContext& failure) {
  const auto normalized  = NormalizePolicy(policy);
  const auto max_retries = std::min(failure.max_retries(), normalized.max_retries());

  if (failure.retry_count() < max_retries && IsRetryable(failure.kind())) {
    return v1::RECOVERY_ACTION_RETRIED;
  }

  if (failure.kind().type() == v1::FAILURE_KIND_ALL_REVIEWERS_FAILED) {
    switch (normalized.on_all_reviewers_failed()) {
      case v1::ALL_REVIEWERS_FAILED_ACTION_SAVE_STATE:
        return v1::RECOVERY_ACTION_STOPPED;
      case v1::ALL_REVIEWERS_FAILED_ACTION_CONTINUE_WITHOUT_REVIEW:
        return v1::RECOVERY_ACTION_CONTINUED_WITHOUT_FULL_REVIEW;
      case v1::ALL_REVIEWERS_FAILED_ACTION_ABORT:
      default:
        return v1::RECOVERY_ACTION_ABORTED;
    }
  }

  // escalate to the user
  return v1::RECOVERY_ACTION_STOPPED;
}

std::chrono::seconds BackoffFor(const v1::FailurePolicy& policy, std::uint32_t retry_count) {
  const auto    base    = NormalizePolicy(policy).backoff_secs();
  std::uint64_t backoff = base;
  for (std::uint32_t i = 0; i < retry_count && backoff < kMaxBackoffSecs; ++i) {
    backoff *= 2;
  }
  return std::chrono::seconds(std::min(backoff, kMaxBackoffSecs));
}

void AppendFailure(google::protobuf::RepeatedPtrField<v1::FailureContext>* history, const v1::FailureContext& failure) {
  *history->Add() = failure;
  const int overflow = history->size() - static_cast<int>(kMaxFailureHistory);
  if (overflow > 0) {
    history->DeleteSubrange(0, overflow);
  }
}

} // namespace planner::domain
