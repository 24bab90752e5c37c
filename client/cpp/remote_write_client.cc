#include "client/cpp/remote_write_client.h"

#include <string_view>

#include <grpcpp/client_context.h>

#include "internal/intake/remote_write_decoder.hpp"

namespace tsbatch::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

} // namespace

RemoteWriteClient::RemoteWriteClient(std::shared_ptr<grpc::Channel> channel)
    : write_stub_(tsbatch::v1::RemoteWriteService::NewStub(channel)),
      admin_stub_(tsbatch::v1::AdminService::NewStub(std::move(channel))) {}

arrow::Result<tsbatch::v1::WriteResponse> RemoteWriteClient::Write(const tsbatch::v1::WriteRequest& request) const {
  tsbatch::v1::WriteResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(write_stub_->Write(&ctx, request, &response), "Write"));
  return response;
}

arrow::Result<tsbatch::v1::WriteResponse> RemoteWriteClient::WriteEncoded(const tsbatch::v1::WriteRequest& request,
                                                                          tsbatch::v1::PayloadEncoding encoding) const {
  std::string body;
  try {
    body = tsbatch::intake::EncodeWriteRequest(request, encoding);
  } catch (const std::exception& e) {
    return arrow::Status::Invalid("encode WriteRequest: ", e.what());
  }
  return WriteRaw(std::move(body), encoding);
}

arrow::Result<tsbatch::v1::WriteResponse> RemoteWriteClient::WriteRaw(std::string body, tsbatch::v1::PayloadEncoding encoding) const {
  tsbatch::v1::EncodedWriteRequest request;
  request.set_body(std::move(body));
  request.set_encoding(encoding);

  tsbatch::v1::WriteResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(write_stub_->WriteEncoded(&ctx, request, &response), "WriteEncoded"));
  return response;
}

arrow::Result<tsbatch::v1::FlushResponse> RemoteWriteClient::Flush() const {
  tsbatch::v1::FlushRequest  request;
  tsbatch::v1::FlushResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Flush(&ctx, request, &response), "Flush"));
  return response;
}

arrow::Result<tsbatch::v1::StatsResponse> RemoteWriteClient::Stats() const {
  tsbatch::v1::StatsRequest  request;
  tsbatch::v1::StatsResponse response;
  grpc::ClientContext ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Stats(&ctx, request, &response), "Stats"));
  return response;
}

} // namespace tsbatch::client
