#include "admin_service.hpp"

#include "internal/pipeline/pipeline.hpp"
#include "internal/service/observe_rpc.hpp"

namespace tsbatch::service {

using namespace tsbatch::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FlushResponse AdminService::Flush(const FlushRequest&) {
  return ObserveRpc("AdminService.Flush", [&] {
    FlushResponse resp;
    if (const auto staged = ctx_.pipeline->Flush()) {
      resp.set_staged(true);
      resp.set_path(staged->path.string());
    }
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    const auto stats = ctx_.pipeline->Stats();

    StatsResponse resp;
    resp.set_records_enqueued(stats.records_enqueued);
    resp.set_flushes(stats.flushes);
    resp.set_files_staged(stats.files_staged);
    resp.set_records_staged(stats.records_staged);
    resp.set_staging_failures(stats.staging_failures);
    resp.set_upload_attempts(stats.upload_attempts);
    resp.set_uploads_succeeded(stats.uploads_succeeded);
    resp.set_uploads_already_ingested(stats.uploads_already_ingested);
    resp.set_uploads_failed_permanently(stats.uploads_failed_permanently);
    resp.set_files_missing(stats.files_missing);
    resp.set_buffer_depth(stats.buffer_depth);
    resp.set_queue_depth(stats.queue_depth);
    resp.set_inflight_correlation_ids(stats.inflight_correlation_ids);
    return resp;
  });
}

} // namespace tsbatch::service
