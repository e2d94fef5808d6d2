#pragma once

#include "planner/v1/daemon_service.pb.h"
#include "service_context.hpp"

namespace planner::service {

class FileService {
 public:
  explicit FileService(ServiceContext ctx);

  v1::ListSessionFilesResponse ListSessionFiles(const v1::ListSessionFilesRequest& req);
  v1::ReadSessionFileResponse  ReadSessionFile(const v1::ReadSessionFileRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace planner::service
