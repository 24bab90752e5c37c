#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace tsbatch::grpc {

AdminServer::AdminServer(std::shared_ptr<tsbatch::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Flush(::grpc::ServerContext*, const tsbatch::v1::FlushRequest* req, tsbatch::v1::FlushResponse* resp) {
  try {
    *resp = service_->Flush(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const tsbatch::v1::StatsRequest* req, tsbatch::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tsbatch::grpc
