#include "internal/ingest/ingestion_worker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "internal/ingest/idempotency_cache.hpp"
#include "internal/ingest/ingestion_queue.hpp"
#include "internal/staging/batch_codec.hpp"
#include "tests/unit/fake_bulk_loader.hpp"

namespace {

using tsbatch::ingest::IdempotencyCache;
using tsbatch::ingest::IngestionQueue;
using tsbatch::ingest::IngestionWorker;
using tsbatch::ingest::RetryPolicy;
using tsbatch::ingest::UploadState;
using tsbatch::testing::FakeBulkLoader;
using tsbatch::testing::MakeSeries;
using tsbatch::testing::MakeTempDir;
using Outcome = FakeBulkLoader::Outcome;

tsbatch::sink::DestinationDescriptor Destination() {
  tsbatch::sink::DestinationDescriptor destination;
  destination.database     = "metrics";
  destination.table        = "timeseries";
  destination.mapping_name = "prom_mapping";
  return destination;
}

std::filesystem::path WriteStagingFile(const std::filesystem::path& dir, const std::string& name) {
  const auto    path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << tsbatch::staging::EncodeBatch({MakeSeries("up", name)});
  return path;
}

struct Fixture {
  std::shared_ptr<IngestionQueue>   queue  = std::make_shared<IngestionQueue>();
  std::shared_ptr<IdempotencyCache> cache  = std::make_shared<IdempotencyCache>();
  std::shared_ptr<FakeBulkLoader>   loader;
  std::unique_ptr<IngestionWorker>  worker;

  Fixture(std::vector<Outcome> script, RetryPolicy policy) : loader(std::make_shared<FakeBulkLoader>(std::move(script))) {
    worker = std::make_unique<IngestionWorker>(queue, cache, loader, Destination(), policy);
  }
};

RetryPolicy FastRetries(uint32_t max_retries) {
  RetryPolicy policy;
  policy.max_retries     = max_retries;
  policy.between_retries = std::chrono::milliseconds(1);
  return policy;
}

void TestRetriesUntilSuccessWithSameCorrelationId() {
  const auto dir  = MakeTempDir("worker_retry_success");
  const auto file = WriteStagingFile(dir, "timeseries_a.json");

  Fixture          f({Outcome::kFail, Outcome::kThrow, Outcome::kSucceed}, FastRetries(3));
  std::stop_source stop;

  assert(f.worker->ProcessFile(file, stop.get_token()) == UploadState::kSucceeded);

  const auto calls = f.loader->Calls();
  assert(calls.size() == 3);
  assert(!calls[0].correlation_id.empty());
  assert(calls[1].correlation_id == calls[0].correlation_id);
  assert(calls[2].correlation_id == calls[0].correlation_id);

  assert(!std::filesystem::exists(file));
  assert(f.cache->Size() == 0);
  assert(f.worker->counters().attempts == 3);
  assert(f.worker->counters().succeeded == 1);
}

// Routes the default logger into a ring buffer for the duration of a test.
class CapturedLog {
 public:
  CapturedLog() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128)), previous_(spdlog::default_logger()) {
    spdlog::drop("tsbatch");
    auto logger = std::make_shared<spdlog::logger>("tsbatch", sink_);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }

  ~CapturedLog() {
    spdlog::drop("tsbatch");
    spdlog::set_default_logger(previous_);
  }

  std::size_t Count(const std::string& needle) const {
    std::size_t count = 0;
    for (const auto& line : sink_->last_formatted()) {
      if (line.find(needle) != std::string::npos) ++count;
    }
    return count;
  }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
  std::shared_ptr<spdlog::logger>                    previous_;
};

void TestPermanentFailureLeavesFileAndReleasesId() {
  const auto  dir  = MakeTempDir("worker_permanent");
  const auto  file = WriteStagingFile(dir, "timeseries_b.json");
  CapturedLog log;

  Fixture          f({Outcome::kFail, Outcome::kFail, Outcome::kFail, Outcome::kFail}, FastRetries(3));
  std::stop_source stop;

  assert(f.worker->ProcessFile(file, stop.get_token()) == UploadState::kPermanentlyFailed);

  const auto calls = f.loader->Calls();
  assert(calls.size() == 3);
  assert(calls[2].correlation_id == calls[0].correlation_id);

  assert(std::filesystem::exists(file));
  assert(!f.cache->Get(file.string()).has_value());
  assert(f.cache->Size() == 0);
  assert(f.worker->counters().failed_permanently == 1);
  assert(log.Count("Permanent ingestion failure") == 1);
}

void TestSingleAttemptWhenMaxRetriesIsOne() {
  const auto dir  = MakeTempDir("worker_single_attempt");
  const auto file = WriteStagingFile(dir, "timeseries_c.json");

  Fixture          f({Outcome::kThrow}, FastRetries(1));
  std::stop_source stop;

  assert(f.worker->ProcessFile(file, stop.get_token()) == UploadState::kPermanentlyFailed);
  assert(f.loader->CallCount() == 1);
  assert(std::filesystem::exists(file));
}

void TestMissingFileIsSkippedAndReleased() {
  const auto dir = MakeTempDir("worker_missing");

  Fixture          f({}, FastRetries(3));
  std::stop_source stop;

  assert(f.worker->ProcessFile(dir / "gone.json", stop.get_token()) == UploadState::kMissing);
  assert(f.loader->CallCount() == 0);
  assert(f.cache->Size() == 0);
  assert(f.worker->counters().missing == 1);
}

void TestFileVanishingBetweenAttemptsEndsRetries() {
  const auto dir  = MakeTempDir("worker_vanish");
  const auto file = WriteStagingFile(dir, "timeseries_d.json");

  Fixture f({Outcome::kFail, Outcome::kFail, Outcome::kFail}, FastRetries(3));
  f.loader->SetOnCall([](const tsbatch::sink::IngestRequest& request) { std::filesystem::remove(request.source_path); });
  std::stop_source stop;

  assert(f.worker->ProcessFile(file, stop.get_token()) == UploadState::kMissing);
  assert(f.loader->CallCount() == 1);
  assert(f.cache->Size() == 0);
}

void TestStopDuringBackoffReturnsPromptly() {
  const auto dir  = MakeTempDir("worker_cancel");
  const auto file = WriteStagingFile(dir, "timeseries_e.json");

  RetryPolicy policy;
  policy.max_retries     = 5;
  policy.between_retries = std::chrono::seconds(30);

  Fixture          f({Outcome::kFail, Outcome::kFail, Outcome::kFail, Outcome::kFail, Outcome::kFail}, policy);
  std::stop_source stop;

  std::atomic<UploadState> state{UploadState::kPending};
  std::thread              runner([&] { state = f.worker->ProcessFile(file, stop.get_token()); });

  assert(tsbatch::testing::WaitFor([&] { return f.loader->CallCount() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  const auto stop_requested_at = std::chrono::steady_clock::now();
  stop.request_stop();
  runner.join();

  assert(std::chrono::steady_clock::now() - stop_requested_at < std::chrono::seconds(2));
  assert(state.load() == UploadState::kCancelled);
  assert(f.loader->CallCount() == 1);
  assert(std::filesystem::exists(file));
  assert(f.cache->Size() == 0);
}

void TestBackgroundLoopUploadsInQueueOrder() {
  const auto dir    = MakeTempDir("worker_loop");
  const auto first  = WriteStagingFile(dir, "timeseries_1.json");
  const auto second = WriteStagingFile(dir, "timeseries_2.json");
  const auto third  = WriteStagingFile(dir, "timeseries_3.json");

  Fixture          f({}, FastRetries(3));
  std::stop_source stop;

  f.queue->Enqueue(first);
  f.queue->Enqueue(second);
  f.worker->Start(stop.get_token());
  f.queue->Enqueue(third);

  assert(tsbatch::testing::WaitFor([&] { return f.worker->counters().succeeded == 3; }));

  stop.request_stop();
  f.worker->Join();

  const auto calls = f.loader->Calls();
  assert(calls.size() == 3);
  assert(calls[0].source_path == first);
  assert(calls[1].source_path == second);
  assert(calls[2].source_path == third);
  assert(calls[0].correlation_id != calls[1].correlation_id);
  assert(tsbatch::testing::CountFiles(dir) == 0);
}

void TestUploadStateTransitions() {
  using tsbatch::ingest::CanTransition;
  static_assert(CanTransition(UploadState::kPending, UploadState::kUploading));
  static_assert(CanTransition(UploadState::kUploading, UploadState::kRetrying));
  static_assert(CanTransition(UploadState::kRetrying, UploadState::kUploading));
  static_assert(CanTransition(UploadState::kRetrying, UploadState::kCancelled));
  static_assert(!CanTransition(UploadState::kSucceeded, UploadState::kUploading));
  static_assert(!CanTransition(UploadState::kPending, UploadState::kSucceeded));
  assert(tsbatch::ingest::ToString(UploadState::kPermanentlyFailed) == "permanently_failed");
}

} // namespace

int main() {
  TestRetriesUntilSuccessWithSameCorrelationId();
  TestPermanentFailureLeavesFileAndReleasesId();
  TestSingleAttemptWhenMaxRetriesIsOne();
  TestMissingFileIsSkippedAndReleased();
  TestFileVanishingBetweenAttemptsEndsRetries();
  TestStopDuringBackoffReturnsPromptly();
  TestBackgroundLoopUploadsInQueueOrder();
  TestUploadStateTransitions();

  std::cout << "tsbatch_unit_ingestion_worker: pass\n";
  return 0;
}
