#include "daemon_client.h"

#include <grpcpp/grpcpp.h>

#include "internal/daemon/port_file.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

namespace planner::client {

DaemonClient::DaemonClient(std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<::grpc::Channel> subscriber_channel, std::string token,
                           std::chrono::milliseconds timeout)
    : daemon_(v1::DaemonService::NewStub(channel)),
      files_(v1::DaemonFileService::NewStub(channel)),
      subscriptions_(subscriber_channel ? std::shared_ptr<v1::SubscriptionService::Stub>(v1::SubscriptionService::NewStub(subscriber_channel))
                                        : nullptr),
      token_(std::move(token)),
      timeout_(timeout) {
}

DaemonClient DaemonClient::FromPortFile(const std::filesystem::path& port_file, const std::string& host, std::chrono::milliseconds timeout) {
  const auto info = daemon::ReadPortFile(port_file);

  auto channel = ::grpc::CreateChannel(runtime::JoinHostPort(host, info.port()), ::grpc::InsecureChannelCredentials());
  std::shared_ptr<::grpc::Channel> subscriber_channel;
  if (info.subscriber_port() != 0) {
    subscriber_channel = ::grpc::CreateChannel(runtime::JoinHostPort(host, info.subscriber_port()), ::grpc::InsecureChannelCredentials());
  }
  return DaemonClient(std::move(channel), std::move(subscriber_channel), info.token(), timeout);
}

void DaemonClient::Prepare(::grpc::ClientContext* context, bool authenticated) const {
  context->set_deadline(std::chrono::system_clock::now() + timeout_);
  if (authenticated) {
    context->AddMetadata("authorization", "Bearer " + token_);
  }
}

void DaemonClient::Authenticate() const {
  ::grpc::ClientContext context;
  Prepare(&context, false);

  v1::AuthenticateRequest req;
  req.set_token(token_);
  v1::AuthenticateResponse resp;
  RaiseForStatus(daemon_->Authenticate(&context, req, &resp));
}

std::string DaemonClient::Register(const v1::SessionRecord& record) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::RegisterRequest req;
  *req.mutable_record() = record;
  v1::RegisterResponse resp;
  RaiseForStatus(daemon_->Register(&context, req, &resp));
  return resp.build_sha();
}

std::string DaemonClient::Update(const v1::SessionRecord& record) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::UpdateRequest req;
  *req.mutable_record() = record;
  v1::UpdateResponse resp;
  RaiseForStatus(daemon_->Update(&context, req, &resp));
  return resp.build_sha();
}

void DaemonClient::Heartbeat(const std::string& session_id) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::HeartbeatRequest req;
  req.set_session_id(session_id);
  v1::HeartbeatResponse resp;
  RaiseForStatus(daemon_->Heartbeat(&context, req, &resp));
}

std::vector<v1::SessionRecord> DaemonClient::List() const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::ListResponse resp;
  RaiseForStatus(daemon_->List(&context, v1::ListRequest{}, &resp));
  return {resp.sessions().begin(), resp.sessions().end()};
}

void DaemonClient::ForceStop(const std::string& session_id) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::ForceStopRequest req;
  req.set_session_id(session_id);
  v1::ForceStopResponse resp;
  RaiseForStatus(daemon_->ForceStop(&context, req, &resp));
}

void DaemonClient::Shutdown() const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::ShutdownResponse resp;
  RaiseForStatus(daemon_->Shutdown(&context, v1::ShutdownRequest{}, &resp));
}

std::string DaemonClient::BuildSha() const {
  ::grpc::ClientContext context;
  Prepare(&context, false);

  v1::BuildShaResponse resp;
  RaiseForStatus(daemon_->BuildSha(&context, v1::BuildShaRequest{}, &resp));
  return resp.build_sha();
}

std::uint64_t DaemonClient::BuildTimestamp() const {
  ::grpc::ClientContext context;
  Prepare(&context, false);

  v1::BuildTimestampResponse resp;
  RaiseForStatus(daemon_->BuildTimestamp(&context, v1::BuildTimestampRequest{}, &resp));
  return resp.build_timestamp();
}

bool DaemonClient::RequestUpgrade(std::uint64_t caller_build_timestamp) const {
  ::grpc::ClientContext context;
  Prepare(&context, false);

  v1::RequestUpgradeRequest req;
  req.set_caller_build_timestamp(caller_build_timestamp);
  v1::RequestUpgradeResponse resp;
  RaiseForStatus(daemon_->RequestUpgrade(&context, req, &resp));
  return resp.accepted();
}

void DaemonClient::PublishWorkflowEvent(const std::string& session_id, const v1::WorkflowEventEnvelope& envelope) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::WorkflowEventRequest req;
  req.set_session_id(session_id);
  *req.mutable_envelope() = envelope;
  v1::WorkflowEventResponse resp;
  RaiseForStatus(daemon_->PublishWorkflowEvent(&context, req, &resp));
}

std::vector<v1::FileEntry> DaemonClient::ListSessionFiles(const std::string& session_id) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::ListSessionFilesRequest req;
  req.set_session_id(session_id);
  v1::ListSessionFilesResponse resp;
  RaiseForStatus(files_->ListSessionFiles(&context, req, &resp));
  return {resp.entries().begin(), resp.entries().end()};
}

v1::FileContent DaemonClient::ReadSessionFile(const std::string& session_id, const std::string& filename) const {
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::ReadSessionFileRequest req;
  req.set_session_id(session_id);
  req.set_filename(filename);
  v1::ReadSessionFileResponse resp;
  RaiseForStatus(files_->ReadSessionFile(&context, req, &resp));
  return resp.content();
}

std::uint64_t DaemonClient::Subscribe(const std::string& callback_address) const {
  if (!subscriptions_) {
    throw util::Internal("daemon did not advertise a subscriber port");
  }
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::SubscribeRequest req;
  req.set_callback_address(callback_address);
  v1::SubscribeResponse resp;
  RaiseForStatus(subscriptions_->Subscribe(&context, req, &resp));
  return resp.subscriber_id();
}

void DaemonClient::Unsubscribe(std::uint64_t subscriber_id) const {
  if (!subscriptions_) {
    throw util::Internal("daemon did not advertise a subscriber port");
  }
  ::grpc::ClientContext context;
  Prepare(&context);

  v1::UnsubscribeRequest req;
  req.set_subscriber_id(subscriber_id);
  v1::UnsubscribeResponse resp;
  RaiseForStatus(subscriptions_->Unsubscribe(&context, req, &resp));
}

} // namespace planner::client
