#pragma once

#include "service_context.hpp"
#include "tsbatch/v1/ingest.pb.h"

namespace tsbatch::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  tsbatch::v1::FlushResponse Flush(const tsbatch::v1::FlushRequest& req);

  tsbatch::v1::StatsResponse Stats(const tsbatch::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tsbatch::service
