#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/channel.h>

#include "internal/grpc/grpc_error.hpp"
#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::client {

using planner::grpc::RaiseForStatus;

/*
  Blocking client for the session daemon.

  Every call carries the bearer token and a deadline. Failures are
  rethrown as the daemon's typed exceptions (see grpc::RaiseForStatus).
*/
class DaemonClient {
 public:
  DaemonClient(std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<::grpc::Channel> subscriber_channel, std::string token,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  // Connects using <home>/sessiond.port.
  static DaemonClient FromPortFile(const std::filesystem::path& port_file, const std::string& host = "127.0.0.1",
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  void Authenticate() const;

  std::string                    Register(const v1::SessionRecord& record) const;
  std::string                    Update(const v1::SessionRecord& record) const;
  void                           Heartbeat(const std::string& session_id) const;
  std::vector<v1::SessionRecord> List() const;
  void                           ForceStop(const std::string& session_id) const;
  void                           Shutdown() const;

  std::string   BuildSha() const;
  std::uint64_t BuildTimestamp() const;
  bool          RequestUpgrade(std::uint64_t caller_build_timestamp) const;

  void PublishWorkflowEvent(const std::string& session_id, const v1::WorkflowEventEnvelope& envelope) const;

  std::vector<v1::FileEntry> ListSessionFiles(const std::string& session_id) const;
  v1::FileContent            ReadSessionFile(const std::string& session_id, const std::string& filename) const;

  std::uint64_t Subscribe(const std::string& callback_address) const;
  void          Unsubscribe(std::uint64_t subscriber_id) const;

 private:
  void Prepare(::grpc::ClientContext* context, bool authenticated = true) const;

  std::shared_ptr<v1::DaemonService::Stub>       daemon_;
  std::shared_ptr<v1::DaemonFileService::Stub>   files_;
  std::shared_ptr<v1::SubscriptionService::Stub> subscriptions_;
  std::string                                    token_;
  std::chrono::milliseconds                      timeout_;
};

} // namespace planner::client
