#include "internal/staging/staging_writer.hpp"

#include <atomic>
#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <thread>
#include <vector>

#include "internal/buffer/intake_buffer.hpp"
#include "internal/ingest/ingestion_queue.hpp"
#include "internal/staging/batch_codec.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fake_bulk_loader.hpp"

namespace {

using tsbatch::buffer::IntakeBuffer;
using tsbatch::ingest::IngestionQueue;
using tsbatch::staging::FlushReason;
using tsbatch::staging::FlushResult;
using tsbatch::staging::StagingOptions;
using tsbatch::staging::StagingWriter;
using tsbatch::testing::CountFiles;
using tsbatch::testing::MakeSeries;
using tsbatch::testing::MakeTempDir;
using tsbatch::testing::SeriesId;

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

StagingOptions Options(const std::filesystem::path& dir) {
  StagingOptions options;
  options.directory   = dir;
  options.file_prefix = "timeseries";
  options.fsync       = true;
  return options;
}

void TestEmptyDrainWritesNothing() {
  const auto     dir = MakeTempDir("staging_empty");
  IntakeBuffer   buffer;
  IngestionQueue queue;
  StagingWriter  writer(Options(dir), buffer, queue);
  writer.Prepare();

  assert(!writer.Flush(FlushReason::kInterval).has_value());
  assert(queue.Size() == 0);
  assert(CountFiles(dir) == 0);
}

void TestFlushWritesBatchAndPublishesPath() {
  const auto     dir = MakeTempDir("staging_content");
  IntakeBuffer   buffer;
  IngestionQueue queue;
  StagingWriter  writer(Options(dir), buffer, queue);
  writer.Prepare();

  buffer.Enqueue(MakeSeries("http_requests_total", "a", 1.5, 100));
  buffer.Enqueue(MakeSeries("http_requests_total", "b", 2.5, 200));
  buffer.Enqueue(MakeSeries("http_requests_total", "c", 3.5, 300));

  const auto result = writer.Flush(FlushReason::kExplicit);
  assert(result.has_value());
  assert(result->records == 3);
  assert(buffer.Size() == 0);

  const auto name = result->path.filename().string();
  assert(name.rfind("timeseries_", 0) == 0);
  assert(result->path.extension() == ".json");
  // timeseries_yyyyMMddTHHmmssSSS_000001.json
  assert(name.size() == std::string("timeseries_20240101T000000000_000001.json").size());
  assert(name[19] == 'T');

  assert(queue.Size() == 1);
  assert(queue.TryDequeue().value() == result->path);
  assert(CountFiles(dir) == 1);

  const auto decoded = tsbatch::staging::DecodeBatch(ReadFile(result->path));
  assert(decoded.size() == 3);
  assert(SeriesId(decoded[0]) == "a");
  assert(SeriesId(decoded[1]) == "b");
  assert(SeriesId(decoded[2]) == "c");
  assert(decoded[2].samples(0).value() == 3.5);
  assert(decoded[2].samples(0).timestamp() == 300);
}

void TestSuccessiveFlushesUseDistinctNames() {
  const auto     dir = MakeTempDir("staging_names");
  IntakeBuffer   buffer;
  IngestionQueue queue;
  StagingWriter  writer(Options(dir), buffer, queue);
  writer.Prepare();

  std::vector<std::filesystem::path> paths;
  for (int i = 0; i < 5; ++i) {
    buffer.Enqueue(MakeSeries("up", std::to_string(i)));
    paths.push_back(writer.Flush(FlushReason::kThreshold)->path);
  }

  for (std::size_t i = 1; i < paths.size(); ++i) {
    assert(paths[i] != paths[i - 1]);
    assert(paths[i - 1].filename().string() < paths[i].filename().string());
  }
  assert(CountFiles(dir) == 5);
  assert(queue.Size() == 5);
}

void TestConcurrentFlushesProduceOneFile() {
  const auto     dir = MakeTempDir("staging_concurrent");
  IntakeBuffer   buffer;
  IngestionQueue queue;
  StagingWriter  writer(Options(dir), buffer, queue);
  writer.Prepare();

  for (int i = 0; i < 50; ++i) {
    buffer.Enqueue(MakeSeries("up", std::to_string(i)));
  }

  std::atomic<bool>                       go{false};
  std::vector<std::optional<FlushResult>> results(8);
  std::vector<std::thread>                threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      results[i] = writer.Flush(i % 2 == 0 ? FlushReason::kThreshold : FlushReason::kInterval);
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  std::size_t non_empty = 0;
  for (const auto& result : results) {
    if (result) {
      ++non_empty;
      assert(result->records == 50);
    }
  }
  assert(non_empty == 1);
  assert(queue.Size() == 1);
  assert(CountFiles(dir) == 1);
}

void TestUnsyncedFlushStillPublishes() {
  const auto     dir     = MakeTempDir("staging_no_fsync");
  auto           options = Options(dir);
  IntakeBuffer   buffer;
  IngestionQueue queue;
  options.fsync = false;
  StagingWriter writer(options, buffer, queue);
  writer.Prepare();

  buffer.Enqueue(MakeSeries("up", "a"));
  const auto result = writer.Flush(FlushReason::kExplicit);
  assert(result.has_value());
  assert(queue.Size() == 1);
  assert(CountFiles(dir) == 1);
}

void TestPrepareRemovesStaleTemporaries() {
  const auto dir = MakeTempDir("staging_stale_tmp");
  std::ofstream(dir / "timeseries_20240101T000000000_000001.json.tmp") << "partial";
  std::ofstream(dir / "timeseries_20240101T000000000_000002.json") << "";
  std::ofstream(dir / "other.json.tmp") << "unrelated";

  IntakeBuffer   buffer;
  IngestionQueue queue;
  StagingWriter  writer(Options(dir), buffer, queue);
  writer.Prepare();

  assert(!std::filesystem::exists(dir / "timeseries_20240101T000000000_000001.json.tmp"));
  assert(std::filesystem::exists(dir / "timeseries_20240101T000000000_000002.json"));
  assert(std::filesystem::exists(dir / "other.json.tmp"));
  assert(CountFiles(dir) == 2);
}

void TestSyncDirectory() {
  const auto dir = MakeTempDir("staging_sync_dir");
  tsbatch::staging::SyncDirectory(dir);

  bool threw = false;
  try {
    tsbatch::staging::SyncDirectory(dir / "missing");
  } catch (const tsbatch::util::StagingError&) {
    threw = true;
  }
  assert(threw);
}

void TestWriteFailureDropsBatchAndPublishesNothing() {
  const auto dir     = MakeTempDir("staging_failure");
  const auto blocker = dir / "not_a_directory";
  std::ofstream(blocker) << "x";

  IntakeBuffer   buffer;
  IngestionQueue queue;
  StagingWriter  writer(Options(blocker / "staging"), buffer, queue);

  bool prepare_threw = false;
  try {
    writer.Prepare();
  } catch (const tsbatch::util::StagingError&) {
    prepare_threw = true;
  }
  assert(prepare_threw);

  buffer.Enqueue(MakeSeries("up", "lost"));

  bool threw = false;
  try {
    (void)writer.Flush(FlushReason::kExplicit);
  } catch (const tsbatch::util::StagingError&) {
    threw = true;
  }

  assert(threw);
  assert(queue.Size() == 0);
  assert(buffer.Size() == 0);
  assert(CountFiles(dir) == 1);
}

} // namespace

int main() {
  TestEmptyDrainWritesNothing();
  TestFlushWritesBatchAndPublishesPath();
  TestSuccessiveFlushesUseDistinctNames();
  TestConcurrentFlushesProduceOneFile();
  TestUnsyncedFlushStillPublishes();
  TestPrepareRemovesStaleTemporaries();
  TestSyncDirectory();
  TestWriteFailureDropsBatchAndPublishesNothing();

  std::cout << "tsbatch_unit_staging_writer: pass\n";
  return 0;
}
