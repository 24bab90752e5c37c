#include "ingest_service.hpp"

#include "internal/intake/remote_write_decoder.hpp"
#include "internal/pipeline/pipeline.hpp"
#include "internal/service/observe_rpc.hpp"

namespace tsbatch::service {

using namespace tsbatch::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

WriteResponse IngestService::Write(const WriteRequest& req) {
  return ObserveRpc("RemoteWriteService.Write", [&] { return Accept(req); });
}

WriteResponse IngestService::WriteEncoded(const EncodedWriteRequest& req) {
  return ObserveRpc("RemoteWriteService.WriteEncoded", [&] {
    const auto decoded = tsbatch::intake::DecodeWriteRequest(req.body(), req.encoding());
    return Accept(decoded);
  });
}

WriteResponse IngestService::Accept(const WriteRequest& req) {
  WriteResponse resp;
  resp.set_accepted_series(ctx_.pipeline->EnqueueAll(req));
  return resp;
}

} // namespace tsbatch::service
