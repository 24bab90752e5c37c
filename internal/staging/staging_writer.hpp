#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tsbatch::buffer {
class IntakeBuffer;
}
namespace tsbatch::ingest {
class IngestionQueue;
}

namespace tsbatch::staging {

struct StagingOptions {
  std::filesystem::path directory;
  std::string           file_prefix{"timeseries"};
  bool                  fsync = false;
};

enum class FlushReason {
  kThreshold,
  kInterval,
  kExplicit,
  kShutdown,
};

std::string_view ToString(FlushReason reason);

// fsync(2) on a directory, so a rename inside it survives a crash.
// Throws util::StagingError.
void SyncDirectory(const std::filesystem::path& directory);

struct FlushResult {
  std::filesystem::path path;
  std::size_t           records = 0;
};

/*
  Drains the intake buffer into a new staging file and publishes the file
  to the ingestion queue.

  Drain, serialize, write and publish run under one mutex, so concurrent
  triggers never interleave two drains into one file. A file is published
  only after it has been written under a temporary name and renamed.
*/
class StagingWriter {
 public:
  StagingWriter(StagingOptions options, tsbatch::buffer::IntakeBuffer& buffer, tsbatch::ingest::IngestionQueue& queue);

  // Creates the staging directory if needed and removes temporaries left
  // by an interrupted write. Call before the first Flush.
  void Prepare();

  /*
    Returns nothing when the buffer was empty. On failure the drained batch
    is dropped, no path is published and util::StagingError is thrown.
  */
  std::optional<FlushResult> Flush(FlushReason reason);

  const StagingOptions& options() const {
    return options_;
  }

 private:
  std::filesystem::path NextPathLocked();
  void                  WriteFileLocked(const std::filesystem::path& final_path, const std::string& content);

  StagingOptions                   options_;
  tsbatch::buffer::IntakeBuffer&   buffer_;
  tsbatch::ingest::IngestionQueue& queue_;

  std::mutex flush_mutex_;
  uint64_t   sequence_ = 0;
};

} // namespace tsbatch::staging
