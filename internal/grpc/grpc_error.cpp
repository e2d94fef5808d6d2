#include "grpc_error.hpp"

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"
#include "planner/v1/session.pb.h"

namespace planner::grpc {

namespace {

::grpc::Status WithDetail(::grpc::StatusCode code, const std::exception& e, v1::ErrorDetail detail) {
  detail.set_message(e.what());
  return {code, e.what(), detail.SerializeAsString()};
}

v1::ErrorDetail Kind(v1::ErrorKind kind) {
  v1::ErrorDetail detail;
  detail.set_kind(kind);
  return detail;
}

// Constructors re-add their prefix; hand them the bare text.
std::string Strip(const std::string& message, std::string_view prefix) {
  if (message.compare(0, prefix.size(), prefix) == 0) {
    return message.substr(prefix.size());
  }
  return message;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace planner::util;

  if (auto* ex = dynamic_cast<const SessionNotFound*>(&e)) {
    auto detail = Kind(v1::ERROR_KIND_SESSION_NOT_FOUND);
    detail.set_session_id(ex->session_id());
    return WithDetail(::grpc::StatusCode::NOT_FOUND, e, detail);
  }
  if (dynamic_cast<const FileNotFound*>(&e)) {
    return WithDetail(::grpc::StatusCode::NOT_FOUND, e, Kind(v1::ERROR_KIND_FILE_NOT_FOUND));
  }
  if (auto* ex = dynamic_cast<const AlreadyRegistered*>(&e)) {
    auto detail = Kind(v1::ERROR_KIND_ALREADY_REGISTERED);
    detail.set_session_id(ex->session_id());
    detail.set_existing_pid(ex->existing_pid());
    return WithDetail(::grpc::StatusCode::ALREADY_EXISTS, e, detail);
  }
  if (dynamic_cast<const ShuttingDown*>(&e)) {
    return WithDetail(::grpc::StatusCode::UNAVAILABLE, e, Kind(v1::ERROR_KIND_SHUTTING_DOWN));
  }
  if (dynamic_cast<const AuthenticationFailed*>(&e)) {
    return WithDetail(::grpc::StatusCode::UNAUTHENTICATED, e, Kind(v1::ERROR_KIND_AUTHENTICATION_FAILED));
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return WithDetail(::grpc::StatusCode::PERMISSION_DENIED, e, Kind(v1::ERROR_KIND_PERMISSION_DENIED));
  }
  if (dynamic_cast<const InvalidTransition*>(&e)) {
    return WithDetail(::grpc::StatusCode::FAILED_PRECONDITION, e, Kind(v1::ERROR_KIND_INVALID_TRANSITION));
  }
  if (dynamic_cast<const NotInitialized*>(&e)) {
    return WithDetail(::grpc::StatusCode::FAILED_PRECONDITION, e, Kind(v1::ERROR_KIND_NOT_INITIALIZED));
  }
  if (dynamic_cast<const ConcurrencyConflict*>(&e)) {
    return WithDetail(::grpc::StatusCode::ABORTED, e, Kind(v1::ERROR_KIND_CONCURRENCY_CONFLICT));
  }
  if (dynamic_cast<const StorageFailure*>(&e)) {
    return WithDetail(::grpc::StatusCode::UNAVAILABLE, e, Kind(v1::ERROR_KIND_STORAGE_FAILURE));
  }
  if (dynamic_cast<const IoError*>(&e)) {
    return WithDetail(::grpc::StatusCode::DATA_LOSS, e, Kind(v1::ERROR_KIND_IO_ERROR));
  }

  return WithDetail(::grpc::StatusCode::INTERNAL, e, Kind(v1::ERROR_KIND_INTERNAL));
}

void RaiseForStatus(const ::grpc::Status& status) {
  using namespace planner::util;

  if (status.ok()) {
    return;
  }

  v1::ErrorDetail detail;
  if (status.error_details().empty() || !detail.ParseFromString(status.error_details())) {
    // no details: a transport failure or a non-planner server
    if (status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED) {
      throw AuthenticationFailed();
    }
    throw Internal("rpc failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " + status.error_message());
  }

  const auto& message = detail.message();
  switch (detail.kind()) {
    case v1::ERROR_KIND_SESSION_NOT_FOUND:
      throw SessionNotFound(detail.session_id());
    case v1::ERROR_KIND_ALREADY_REGISTERED:
      throw AlreadyRegistered(detail.session_id(), detail.existing_pid());
    case v1::ERROR_KIND_SHUTTING_DOWN:
      throw ShuttingDown();
    case v1::ERROR_KIND_AUTHENTICATION_FAILED:
      throw AuthenticationFailed();
    case v1::ERROR_KIND_FILE_NOT_FOUND:
      throw FileNotFound(Strip(message, "File not found: "));
    case v1::ERROR_KIND_PERMISSION_DENIED:
      throw PermissionDenied(Strip(message, "Permission denied: "));
    case v1::ERROR_KIND_IO_ERROR:
      throw IoError(Strip(message, "I/O error: "));
    case v1::ERROR_KIND_INVALID_TRANSITION:
      throw InvalidTransition(Strip(message, "invalid transition: "));
    case v1::ERROR_KIND_NOT_INITIALIZED:
      throw NotInitialized();
    case v1::ERROR_KIND_CONCURRENCY_CONFLICT:
      throw ConcurrencyConflict(Strip(message, "concurrency conflict: "));
    case v1::ERROR_KIND_STORAGE_FAILURE:
      throw StorageFailure(Strip(message, "storage failure: "));
    default:
      throw Internal(Strip(message, "Internal error: "));
  }
}

} // namespace planner::grpc
