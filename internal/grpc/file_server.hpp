#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/bearer_auth.hpp"
#include "internal/service/file_service.hpp"
#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::grpc {

class FileServer final : public v1::DaemonFileService::Service {
 public:
  FileServer(std::shared_ptr<service::FileService> svc, TokenCheck check);

  ::grpc::Status ListSessionFiles(::grpc::ServerContext*, const v1::ListSessionFilesRequest*, v1::ListSessionFilesResponse*) override;
  ::grpc::Status ReadSessionFile(::grpc::ServerContext*, const v1::ReadSessionFileRequest*, v1::ReadSessionFileResponse*) override;

 private:
  std::shared_ptr<service::FileService> service_;
  TokenCheck                            check_;
};

} // namespace planner::grpc
