#include "ingestion_worker.hpp"

#include <system_error>

#include "internal/ingest/idempotency_cache.hpp"
#include "internal/ingest/ingestion_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace tsbatch::ingest {

using tsbatch::observability::BoolField;
using tsbatch::observability::IntField;
using tsbatch::observability::Metrics;
using tsbatch::observability::StringField;
using tsbatch::sink::IngestRequest;
using tsbatch::sink::IngestResult;
using tsbatch::sink::IngestStatus;

IngestionWorker::IngestionWorker(std::shared_ptr<IngestionQueue> queue, std::shared_ptr<IdempotencyCache> cache,
                                 tsbatch::sink::BulkLoaderPtr loader, tsbatch::sink::DestinationDescriptor destination, RetryPolicy policy)
    : queue_(std::move(queue)),
      cache_(std::move(cache)),
      loader_(std::move(loader)),
      destination_(std::move(destination)),
      policy_(policy) {}

IngestionWorker::~IngestionWorker() {
  Join();
}

void IngestionWorker::Start(std::stop_token token) {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&IngestionWorker::Run, this, std::move(token));
}

void IngestionWorker::Join() {
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

void IngestionWorker::Run(std::stop_token token) {
  while (!token.stop_requested()) {

    auto path = queue_->Dequeue(token);
    if (!path)
      break;

    try {
      ProcessFile(*path, token);
    }
    catch (const std::exception& e) {
      TSBATCH_LOG_ERROR("Ingestion worker failed to process file", {StringField("path", path->string()), StringField("error", e.what())});
      cache_->Release(path->string());
    }
  }
}

UploadState IngestionWorker::ProcessFile(const std::filesystem::path& path, std::stop_token token) {
  const auto key            = path.string();
  const auto correlation_id = cache_->GetOrCreate(key);

  IngestRequest request;
  request.source_path              = path;
  request.destination              = destination_;
  request.correlation_id           = correlation_id;
  request.delete_source_on_success = true;

  UploadState state   = UploadState::kPending;
  auto        advance = [&](UploadState next) {
    if (!CanTransition(state, next)) {
      throw tsbatch::util::InvalidState("upload " + key + ": invalid transition " + std::string(ToString(state)) + " -> " +
                                        std::string(ToString(next)));
    }
    state = next;
  };

  uint32_t retries = 0;
  for (;;) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      TSBATCH_LOG_WARN("Staging file does not exist, skipping ingestion", {StringField("path", key), StringField("correlation_id", correlation_id)});
      advance(UploadState::kMissing);
      Finish(path, state);
      return state;
    }

    advance(UploadState::kUploading);

    TSBATCH_LOG_INFO("Ingesting staging file", {StringField("path", key), StringField("table", destination_.table),
                                                StringField("correlation_id", correlation_id), IntField("attempt", retries + 1)});
    counters_.attempts.fetch_add(1, std::memory_order_relaxed);

    IngestResult result;
    const auto   started = std::chrono::steady_clock::now();
    try {
      result = loader_->Ingest(request);
    } catch (const std::exception& e) {
      result = IngestResult{IngestStatus::kFailed, e.what()};
    }
    Metrics::Instance().ObserveUploadDurationMs(
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());

    if (result.ok()) {
      if (result.status == IngestStatus::kAlreadyIngested) {
        counters_.already_ingested.fetch_add(1, std::memory_order_relaxed);
      }
      TSBATCH_LOG_INFO("Staging file ingested", {StringField("path", key), StringField("correlation_id", correlation_id),
                                                 BoolField("already_ingested", result.status == IngestStatus::kAlreadyIngested)});
      advance(UploadState::kSucceeded);
      Finish(path, state);
      return state;
    }

    ++retries;
    if (retries >= policy_.max_retries) {
      TSBATCH_LOG_ERROR("Permanent ingestion failure, leaving staging file on disk",
                        {StringField("path", key), StringField("correlation_id", correlation_id), IntField("attempts", retries),
                         StringField("error", result.message)});
      advance(UploadState::kPermanentlyFailed);
      Finish(path, state);
      return state;
    }

    advance(UploadState::kRetrying);
    TSBATCH_LOG_WARN("Ingestion attempt failed, retrying",
                     {StringField("path", key), StringField("correlation_id", correlation_id), IntField("attempt", retries),
                      IntField("backoff_ms", policy_.between_retries.count()), StringField("error", result.message)});

    if (!tsbatch::util::SleepFor(token, policy_.between_retries)) {
      TSBATCH_LOG_WARN("Shutdown during retry backoff, leaving staging file on disk", {StringField("path", key), StringField("correlation_id", correlation_id)});
      advance(UploadState::kCancelled);
      Finish(path, state);
      return state;
    }
  }
}

void IngestionWorker::Finish(const std::filesystem::path& path, UploadState state) {
  cache_->Release(path.string());

  switch (state) {
    case UploadState::kSucceeded:
      counters_.succeeded.fetch_add(1, std::memory_order_relaxed);
      break;
    case UploadState::kPermanentlyFailed:
      counters_.failed_permanently.fetch_add(1, std::memory_order_relaxed);
      break;
    case UploadState::kMissing:
      counters_.missing.fetch_add(1, std::memory_order_relaxed);
      break;
    case UploadState::kCancelled:
      counters_.cancelled.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      break;
  }
  Metrics::Instance().RecordUploadOutcome(ToString(state));
}

} // namespace tsbatch::ingest
