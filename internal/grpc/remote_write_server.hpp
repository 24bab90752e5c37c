#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "tsbatch/v1/remote_write_service.grpc.pb.h"
#include "internal/service/ingest_service.hpp"

namespace tsbatch::grpc {

class RemoteWriteServer final : public tsbatch::v1::RemoteWriteService::Service {
public:
  explicit RemoteWriteServer(std::shared_ptr<tsbatch::service::IngestService> svc);

  ::grpc::Status Write(::grpc::ServerContext*,
                       const tsbatch::v1::WriteRequest*,
                       tsbatch::v1::WriteResponse*) override;

  ::grpc::Status WriteEncoded(::grpc::ServerContext*,
                              const tsbatch::v1::EncodedWriteRequest*,
                              tsbatch::v1::WriteResponse*) override;

private:
  std::shared_ptr<tsbatch::service::IngestService> service_;
};

}
