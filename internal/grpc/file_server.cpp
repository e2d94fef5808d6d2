#include "file_server.hpp"

#include "grpc_error.hpp"

namespace planner::grpc {

FileServer::FileServer(std::shared_ptr<service::FileService> svc, TokenCheck check) : service_(std::move(svc)), check_(std::move(check)) {
}

::grpc::Status FileServer::ListSessionFiles(::grpc::ServerContext* ctx, const v1::ListSessionFilesRequest* req, v1::ListSessionFilesResponse* resp) {
  try {
    RequireBearer(ctx, check_);
    *resp = service_->ListSessionFiles(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::ReadSessionFile(::grpc::ServerContext* ctx, const v1::ReadSessionFileRequest* req, v1::ReadSessionFileResponse* resp) {
  try {
    RequireBearer(ctx, check_);
    *resp = service_->ReadSessionFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace planner::grpc
