#include "pipeline.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <vector>

#include "internal/ingest/idempotency_cache.hpp"
#include "internal/ingest/ingestion_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/interval_flusher.hpp"
#include "internal/util/errors.hpp"

namespace tsbatch::pipeline {

using tsbatch::observability::IntField;
using tsbatch::observability::Metrics;
using tsbatch::observability::StringField;
using tsbatch::staging::FlushReason;
using tsbatch::staging::FlushResult;

Pipeline::Pipeline(PipelineOptions options, tsbatch::sink::BulkLoaderPtr loader)
    : options_(std::move(options)),
      queue_(std::make_shared<tsbatch::ingest::IngestionQueue>()),
      cache_(std::make_shared<tsbatch::ingest::IdempotencyCache>()) {
  if (!loader) {
    throw tsbatch::util::InvalidArgument("pipeline requires a bulk loader");
  }

  writer_ = std::make_unique<tsbatch::staging::StagingWriter>(options_.staging, buffer_, *queue_);
  worker_ = std::make_unique<tsbatch::ingest::IngestionWorker>(queue_, cache_, std::move(loader), options_.destination, options_.retry);
  flusher_ =
      std::make_unique<IntervalFlusher>(options_.max_batch_interval, buffer_, [this] { TriggerFlush(FlushReason::kInterval); });
}

Pipeline::~Pipeline() {
  Shutdown();
}

void Pipeline::Start() {
  std::unique_lock lock(state_mutex_);
  if (state_ == State::kRunning) return;
  if (state_ == State::kStopped) {
    throw tsbatch::util::InvalidState("pipeline has been shut down");
  }

  // A failed start still counts as this pipeline's one run.
  try {
    writer_->Prepare();
    if (options_.recover_on_start) {
      RecoverStagedFiles();
    }

    const auto token = stop_source_.get_token();
    worker_->Start(token);
    flusher_->Start(token);
  } catch (const std::exception& e) {
    stop_source_.request_stop();
    flusher_->Join();
    worker_->Join();
    state_ = State::kStopped;
    TSBATCH_LOG_ERROR("Pipeline failed to start", {StringField("staging_dir", options_.staging.directory.string()), StringField("error", e.what())});
    throw;
  }
  state_ = State::kRunning;

  TSBATCH_LOG_INFO("Pipeline started", {StringField("staging_dir", options_.staging.directory.string()),
                                        IntField("max_batch_size", static_cast<std::int64_t>(options_.max_batch_size)),
                                        IntField("max_batch_interval_ms", options_.max_batch_interval.count()),
                                        IntField("max_retries", options_.retry.max_retries)});
}

/*
  Order matters:
      stop → join flusher → final flush → join worker

  The final flush runs after the flusher is gone, so it cannot race a
  timer flush, and its file stays queued on disk for the next start.
*/
void Pipeline::Shutdown() {
  {
    std::unique_lock lock(state_mutex_);
    if (state_ != State::kRunning) {
      state_ = State::kStopped;
      return;
    }
    state_ = State::kStopped;
  }

  stop_source_.request_stop();
  flusher_->Join();

  if (options_.flush_on_shutdown) {
    TriggerFlush(FlushReason::kShutdown);
  }

  worker_->Join();

  const auto stats = Stats();
  TSBATCH_LOG_INFO("Pipeline stopped", {IntField("records_enqueued", static_cast<std::int64_t>(stats.records_enqueued)),
                                        IntField("files_staged", static_cast<std::int64_t>(stats.files_staged)),
                                        IntField("uploads_succeeded", static_cast<std::int64_t>(stats.uploads_succeeded)),
                                        IntField("files_left_queued", static_cast<std::int64_t>(stats.queue_depth))});
}

bool Pipeline::IsRunning() const {
  std::shared_lock lock(state_mutex_);
  return state_ == State::kRunning;
}

void Pipeline::Enqueue(tsbatch::v1::TimeSeries record) {
  std::shared_lock lock(state_mutex_);
  if (state_ != State::kRunning) {
    throw tsbatch::util::InvalidState("pipeline is not running");
  }
  EnqueueLocked(std::move(record));
}

std::size_t Pipeline::EnqueueAll(const tsbatch::v1::WriteRequest& request) {
  std::shared_lock lock(state_mutex_);
  if (state_ != State::kRunning) {
    throw tsbatch::util::InvalidState("pipeline is not running");
  }

  for (const auto& series : request.timeseries()) {
    EnqueueLocked(series);
  }
  return static_cast<std::size_t>(request.timeseries_size());
}

void Pipeline::EnqueueLocked(tsbatch::v1::TimeSeries record) {
  buffer_.Enqueue(std::move(record));
  records_enqueued_.fetch_add(1, std::memory_order_relaxed);
  Metrics::Instance().AddRecordsEnqueued(1);

  const auto depth = buffer_.Size();
  Metrics::Instance().SetBufferDepth(depth);
  if (depth > options_.max_batch_size) {
    TriggerFlush(FlushReason::kThreshold);
  }
}

std::optional<FlushResult> Pipeline::Flush() {
  std::shared_lock lock(state_mutex_);
  if (state_ != State::kRunning) {
    throw tsbatch::util::InvalidState("pipeline is not running");
  }
  return FlushWithReason(FlushReason::kExplicit);
}

std::optional<FlushResult> Pipeline::FlushWithReason(FlushReason reason) {
  flushes_.fetch_add(1, std::memory_order_relaxed);

  std::optional<FlushResult> result;
  try {
    result = writer_->Flush(reason);
  } catch (const tsbatch::util::StagingError&) {
    staging_failures_.fetch_add(1, std::memory_order_relaxed);
    throw;
  }

  if (result) {
    files_staged_.fetch_add(1, std::memory_order_relaxed);
    records_staged_.fetch_add(result->records, std::memory_order_relaxed);
    Metrics::Instance().ObserveStagedBatchRecords(result->records);
  }
  Metrics::Instance().SetBufferDepth(buffer_.Size());
  return result;
}

void Pipeline::TriggerFlush(FlushReason reason) noexcept {
  try {
    FlushWithReason(reason);
  } catch (const std::exception& e) {
    TSBATCH_LOG_ERROR("Triggered flush failed", {StringField("reason", tsbatch::staging::ToString(reason)), StringField("error", e.what())});
  }
}

/*
  Re-queues staging files left behind by an earlier run. Names sort in
  staging order. Temporaries (".tmp") were already removed by
  StagingWriter::Prepare.
*/
void Pipeline::RecoverStagedFiles() {
  const auto& dir    = options_.staging.directory;
  const auto  prefix = options_.staging.file_prefix + "_";

  std::vector<std::filesystem::path> leftovers;
  std::error_code                    ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;

    const auto name = it->path().filename().string();
    if (name.rfind(prefix, 0) == 0 && it->path().extension() == ".json") {
      leftovers.push_back(it->path());
    }
  }
  if (ec) {
    TSBATCH_LOG_WARN("Failed to scan staging directory for recovery", {StringField("staging_dir", dir.string()), StringField("error", ec.message())});
  }

  std::sort(leftovers.begin(), leftovers.end());
  for (const auto& path : leftovers) {
    queue_->Enqueue(path);
  }

  if (!leftovers.empty()) {
    TSBATCH_LOG_INFO("Recovered staging files", {StringField("staging_dir", dir.string()), IntField("files", static_cast<std::int64_t>(leftovers.size()))});
  }
}

PipelineStats Pipeline::Stats() const {
  const auto& uploads = worker_->counters();

  PipelineStats stats;
  stats.records_enqueued           = records_enqueued_.load(std::memory_order_relaxed);
  stats.flushes                    = flushes_.load(std::memory_order_relaxed);
  stats.files_staged               = files_staged_.load(std::memory_order_relaxed);
  stats.records_staged             = records_staged_.load(std::memory_order_relaxed);
  stats.staging_failures           = staging_failures_.load(std::memory_order_relaxed);
  stats.upload_attempts            = uploads.attempts.load(std::memory_order_relaxed);
  stats.uploads_succeeded          = uploads.succeeded.load(std::memory_order_relaxed);
  stats.uploads_already_ingested   = uploads.already_ingested.load(std::memory_order_relaxed);
  stats.uploads_failed_permanently = uploads.failed_permanently.load(std::memory_order_relaxed);
  stats.files_missing              = uploads.missing.load(std::memory_order_relaxed);
  stats.buffer_depth               = buffer_.Size();
  stats.queue_depth                = queue_->Size();
  stats.inflight_correlation_ids   = cache_->Size();
  return stats;
}

} // namespace tsbatch::pipeline
