#include "remote_write_server.hpp"

#include "grpc_error.hpp"

namespace tsbatch::grpc {

RemoteWriteServer::RemoteWriteServer(std::shared_ptr<tsbatch::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status RemoteWriteServer::Write(::grpc::ServerContext*, const tsbatch::v1::WriteRequest* req, tsbatch::v1::WriteResponse* resp) {
  try {
    *resp = service_->Write(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RemoteWriteServer::WriteEncoded(::grpc::ServerContext*, const tsbatch::v1::EncodedWriteRequest* req,
                                               tsbatch::v1::WriteResponse* resp) {
  try {
    *resp = service_->WriteEncoded(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tsbatch::grpc
