#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "tsbatch/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace tsbatch::grpc {

class AdminServer final : public tsbatch::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<tsbatch::service::AdminService> svc);

  ::grpc::Status Flush(::grpc::ServerContext*,
                       const tsbatch::v1::FlushRequest*,
                       tsbatch::v1::FlushResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const tsbatch::v1::StatsRequest*,
                       tsbatch::v1::StatsResponse*) override;

private:
  std::shared_ptr<tsbatch::service::AdminService> service_;
};

}
