#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <memory>
#include <string>

#include "tsbatch/v1/admin_service.grpc.pb.h"
#include "tsbatch/v1/remote_write_service.grpc.pb.h"

namespace tsbatch::client {

class RemoteWriteClient {
 public:
  explicit RemoteWriteClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<tsbatch::v1::WriteResponse> Write(const tsbatch::v1::WriteRequest& request) const;

  // Sends `request` compressed with `encoding`, as a remote-write agent would.
  arrow::Result<tsbatch::v1::WriteResponse> WriteEncoded(const tsbatch::v1::WriteRequest& request,
                                                         tsbatch::v1::PayloadEncoding encoding = tsbatch::v1::PAYLOAD_ENCODING_SNAPPY) const;

  // Sends an already encoded body as is.
  arrow::Result<tsbatch::v1::WriteResponse> WriteRaw(std::string body, tsbatch::v1::PayloadEncoding encoding) const;

  arrow::Result<tsbatch::v1::FlushResponse> Flush() const;

  arrow::Result<tsbatch::v1::StatsResponse> Stats() const;

 private:
  std::unique_ptr<tsbatch::v1::RemoteWriteService::Stub> write_stub_;
  std::unique_ptr<tsbatch::v1::AdminService::Stub>       admin_stub_;
};

} // namespace tsbatch::client
