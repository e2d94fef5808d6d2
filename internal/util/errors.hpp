#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace planner::util {

/*
  Central error types.

  These get translated later to gRPC status codes and rebuilt on the
  client side from the status details.
*/

// ------------------------------------------------------------
// Workflow
// ------------------------------------------------------------

class WorkflowError : public std::runtime_error {
 public:
  explicit WorkflowError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Command rejected by the state machine.
class InvalidTransition : public WorkflowError {
 public:
  explicit InvalidTransition(const std::string& msg) : WorkflowError("invalid transition: " + msg) {
  }
};

class NotInitialized : public WorkflowError {
 public:
  NotInitialized() : WorkflowError("workflow not initialized") {
  }
};

class StorageFailure : public WorkflowError {
 public:
  explicit StorageFailure(const std::string& msg) : WorkflowError("storage failure: " + msg) {
  }
};

// Optimistic sequence check failed; reload and retry.
class ConcurrencyConflict : public WorkflowError {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : WorkflowError("concurrency conflict: " + msg) {
  }
};

// ------------------------------------------------------------
// Daemon
// ------------------------------------------------------------

class SessionNotFound : public std::runtime_error {
 public:
  explicit SessionNotFound(const std::string& session_id)
      : std::runtime_error("Session not found: " + session_id), session_id_(session_id) {
  }

  const std::string& session_id() const {
    return session_id_;
  }

 private:
  std::string session_id_;
};

class AlreadyRegistered : public std::runtime_error {
 public:
  AlreadyRegistered(const std::string& session_id, std::uint32_t existing_pid)
      : std::runtime_error("Session " + session_id + " already registered by PID " + std::to_string(existing_pid)),
        session_id_(session_id),
        existing_pid_(existing_pid) {
  }

  const std::string& session_id() const {
    return session_id_;
  }
  std::uint32_t existing_pid() const {
    return existing_pid_;
  }

 private:
  std::string   session_id_;
  std::uint32_t existing_pid_;
};

class ShuttingDown : public std::runtime_error {
 public:
  ShuttingDown() : std::runtime_error("Daemon is shutting down") {
  }
};

class AuthenticationFailed : public std::runtime_error {
 public:
  AuthenticationFailed() : std::runtime_error("Authentication failed") {
  }
};

class Internal : public std::runtime_error {
 public:
  explicit Internal(const std::string& msg) : std::runtime_error("Internal error: " + msg) {
  }
};

// ------------------------------------------------------------
// File access
// ------------------------------------------------------------

class FileNotFound : public std::runtime_error {
 public:
  explicit FileNotFound(const std::string& filename) : std::runtime_error("File not found: " + filename) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error("Permission denied: " + msg) {
  }
};

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error("I/O error: " + msg) {
  }
};

} // namespace planner::util
