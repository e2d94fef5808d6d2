#include "file_service.hpp"

#include "internal/daemon/file_access.hpp"
#include "internal/service/observe_rpc.hpp"

namespace planner::service {

FileService::FileService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::ListSessionFilesResponse FileService::ListSessionFiles(const v1::ListSessionFilesRequest& req) {
  return ObserveRpc("DaemonFileService.ListSessionFiles", req.session_id(), [&] {
    v1::ListSessionFilesResponse resp;
    for (auto& entry : ctx_.files->List(req.session_id())) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

v1::ReadSessionFileResponse FileService::ReadSessionFile(const v1::ReadSessionFileRequest& req) {
  return ObserveRpc("DaemonFileService.ReadSessionFile", req.session_id(), [&] {
    v1::ReadSessionFileResponse resp;
    *resp.mutable_content() = ctx_.files->Read(req.session_id(), req.filename());
    return resp;
  });
}

} // namespace planner::service
