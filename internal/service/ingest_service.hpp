#pragma once

#include "service_context.hpp"
#include "tsbatch/v1/ingest.pb.h"
#include "tsbatch/v1/remote.pb.h"

namespace tsbatch::service {

/*
  Intake boundary. A request is decoded completely before anything is
  enqueued, so a malformed payload leaves the buffer untouched.
*/
class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  tsbatch::v1::WriteResponse Write(const tsbatch::v1::WriteRequest& req);

  tsbatch::v1::WriteResponse WriteEncoded(const tsbatch::v1::EncodedWriteRequest& req);

 private:
  tsbatch::v1::WriteResponse Accept(const tsbatch::v1::WriteRequest& req);

  ServiceContext ctx_;
};

} // namespace tsbatch::service
