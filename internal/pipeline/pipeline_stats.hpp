#pragma once

#include <cstdint>

namespace tsbatch::pipeline {

/*
  Point-in-time snapshot of pipeline counters. Depth values are
  approximate.
*/
struct PipelineStats {
  uint64_t records_enqueued           = 0;
  uint64_t flushes                    = 0;
  uint64_t files_staged               = 0;
  uint64_t records_staged             = 0;
  uint64_t staging_failures           = 0;
  uint64_t upload_attempts            = 0;
  uint64_t uploads_succeeded          = 0;
  uint64_t uploads_already_ingested   = 0;
  uint64_t uploads_failed_permanently = 0;
  uint64_t files_missing              = 0;
  uint64_t buffer_depth               = 0;
  uint64_t queue_depth                = 0;
  uint64_t inflight_correlation_ids   = 0;
};

} // namespace tsbatch::pipeline
