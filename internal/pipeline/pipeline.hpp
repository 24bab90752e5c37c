#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>

#include "internal/buffer/intake_buffer.hpp"
#include "internal/ingest/ingestion_worker.hpp"
#include "internal/pipeline/pipeline_stats.hpp"
#include "internal/sink/bulk_loader.hpp"
#include "internal/staging/staging_writer.hpp"
#include "tsbatch/v1/remote.pb.h"

namespace tsbatch::ingest {
class IngestionQueue;
class IdempotencyCache;
}

namespace tsbatch::pipeline {

class IntervalFlusher;

struct PipelineOptions {
  // Threshold trigger fires once the buffer holds more than this.
  std::size_t                          max_batch_size = 1000;
  std::chrono::milliseconds            max_batch_interval{10000};
  tsbatch::staging::StagingOptions     staging;
  tsbatch::ingest::RetryPolicy         retry;
  tsbatch::sink::DestinationDescriptor destination;
  bool                                 recover_on_start  = true;
  bool                                 flush_on_shutdown = true;
};

/*
  Owns the whole batching path:

      producers → IntakeBuffer → [threshold | interval] → StagingWriter
                → IngestionQueue → IngestionWorker → BulkLoader

  One stop source drives both background threads. A pipeline runs at most
  once; Shutdown is idempotent and also runs from the destructor.
*/
class Pipeline {
 public:
  Pipeline(PipelineOptions options, tsbatch::sink::BulkLoaderPtr loader);
  ~Pipeline();

  Pipeline(const Pipeline&)            = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  void Start();
  void Shutdown();

  bool IsRunning() const;

  // Throws util::InvalidState unless running. Staging failures from the
  // threshold trigger are logged, never thrown.
  void        Enqueue(tsbatch::v1::TimeSeries record);
  std::size_t EnqueueAll(const tsbatch::v1::WriteRequest& request);

  // Explicit flush; util::StagingError propagates.
  std::optional<tsbatch::staging::FlushResult> Flush();

  PipelineStats Stats() const;

  const PipelineOptions& options() const {
    return options_;
  }

 private:
  enum class State {
    kCreated,
    kRunning,
    kStopped,
  };

  void EnqueueLocked(tsbatch::v1::TimeSeries record);
  std::optional<tsbatch::staging::FlushResult> FlushWithReason(tsbatch::staging::FlushReason reason);
  void TriggerFlush(tsbatch::staging::FlushReason reason) noexcept;
  void RecoverStagedFiles();

  PipelineOptions options_;

  tsbatch::buffer::IntakeBuffer                     buffer_;
  std::shared_ptr<tsbatch::ingest::IngestionQueue>  queue_;
  std::shared_ptr<tsbatch::ingest::IdempotencyCache> cache_;
  std::unique_ptr<tsbatch::staging::StagingWriter>  writer_;
  std::unique_ptr<tsbatch::ingest::IngestionWorker> worker_;
  std::unique_ptr<IntervalFlusher>                  flusher_;

  std::stop_source          stop_source_;
  mutable std::shared_mutex state_mutex_;
  State                     state_ = State::kCreated;

  std::atomic<uint64_t> records_enqueued_{0};
  std::atomic<uint64_t> flushes_{0};
  std::atomic<uint64_t> files_staged_{0};
  std::atomic<uint64_t> records_staged_{0};
  std::atomic<uint64_t> staging_failures_{0};
};

} // namespace tsbatch::pipeline
