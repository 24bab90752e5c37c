#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <thread>

#include "internal/ingest/upload_state.hpp"
#include "internal/sink/bulk_loader.hpp"

namespace tsbatch::ingest {

class IngestionQueue;
class IdempotencyCache;

struct RetryPolicy {
  // Total attempts per file; at least one attempt is always made.
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds between_retries{1000};
};

struct UploadCounters {
  std::atomic<uint64_t> attempts{0};
  std::atomic<uint64_t> succeeded{0};
  std::atomic<uint64_t> already_ingested{0};
  std::atomic<uint64_t> failed_permanently{0};
  std::atomic<uint64_t> missing{0};
  std::atomic<uint64_t> cancelled{0};
};

/*
  Background worker that uploads staged files, one at a time, in queue
  order.

  Each file keeps one correlation id across all of its attempts. Backoff
  waits happen on this worker's own thread and end early on stop.
*/
class IngestionWorker {
 public:
  IngestionWorker(std::shared_ptr<IngestionQueue> queue, std::shared_ptr<IdempotencyCache> cache, tsbatch::sink::BulkLoaderPtr loader,
                  tsbatch::sink::DestinationDescriptor destination, RetryPolicy policy);
  ~IngestionWorker();

  IngestionWorker(const IngestionWorker&)            = delete;
  IngestionWorker& operator=(const IngestionWorker&) = delete;

  void Start(std::stop_token token);

  // Returns once the current upload (if any) has finished. Stop must already
  // have been requested on the token passed to Start.
  void Join();

  // Runs one file to a terminal state. Exposed for tests.
  UploadState ProcessFile(const std::filesystem::path& path, std::stop_token token);

  const UploadCounters& counters() const noexcept {
    return counters_;
  }

 private:
  void Run(std::stop_token token);
  void Finish(const std::filesystem::path& path, UploadState state);

  std::shared_ptr<IngestionQueue>      queue_;
  std::shared_ptr<IdempotencyCache>    cache_;
  tsbatch::sink::BulkLoaderPtr         loader_;
  tsbatch::sink::DestinationDescriptor destination_;
  RetryPolicy                          policy_;

  UploadCounters counters_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace tsbatch::ingest
