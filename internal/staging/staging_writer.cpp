#include "staging_writer.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <vector>

#include "internal/buffer/intake_buffer.hpp"
#include "internal/ingest/ingestion_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sink/arrow_utils.hpp"
#include "internal/staging/batch_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tsbatch::staging {

using tsbatch::observability::IntField;
using tsbatch::observability::StringField;
using tsbatch::sink::Unwrap;

std::string_view ToString(FlushReason reason) {
  switch (reason) {
    case FlushReason::kThreshold:
      return "threshold";
    case FlushReason::kInterval:
      return "interval";
    case FlushReason::kExplicit:
      return "explicit";
    case FlushReason::kShutdown:
      return "shutdown";
  }
  return "unknown";
}

void SyncDirectory(const std::filesystem::path& directory) {
  const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    throw tsbatch::util::StagingError("failed to open " + directory.string() + " for fsync: " + std::strerror(errno));
  }

  const int rc    = ::fsync(fd);
  const int error = errno;
  ::close(fd);
  if (rc != 0) {
    throw tsbatch::util::StagingError("fsync failed for " + directory.string() + ": " + std::strerror(error));
  }
}

StagingWriter::StagingWriter(StagingOptions options, tsbatch::buffer::IntakeBuffer& buffer, tsbatch::ingest::IngestionQueue& queue)
    : options_(std::move(options)), buffer_(buffer), queue_(queue) {
}

void StagingWriter::Prepare() {
  std::error_code ec;
  std::filesystem::create_directories(options_.directory, ec);
  if (ec) {
    throw tsbatch::util::StagingError("failed to create staging directory " + options_.directory.string() + ": " + ec.message());
  }

  const auto                         prefix = options_.file_prefix + "_";
  std::vector<std::filesystem::path> stale;
  for (std::filesystem::directory_iterator it(options_.directory, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.rfind(prefix, 0) == 0 && it->path().extension() == ".tmp") {
      stale.push_back(it->path());
    }
  }
  if (ec) {
    TSBATCH_LOG_WARN("Failed to scan staging directory", {StringField("staging_dir", options_.directory.string()), StringField("error", ec.message())});
  }

  std::size_t removed = 0;
  for (const auto& path : stale) {
    std::error_code remove_ec;
    if (std::filesystem::remove(path, remove_ec)) {
      ++removed;
    } else if (remove_ec) {
      TSBATCH_LOG_WARN("Failed to remove stale staging temporary", {StringField("path", path.string()), StringField("error", remove_ec.message())});
    }
  }
  if (removed > 0) {
    TSBATCH_LOG_INFO("Removed stale staging temporaries", {StringField("staging_dir", options_.directory.string()), IntField("files", static_cast<std::int64_t>(removed))});
  }
}

std::optional<FlushResult> StagingWriter::Flush(FlushReason reason) {
  std::lock_guard lock(flush_mutex_);

  auto batch = buffer_.DrainAll();
  if (batch.empty()) {
    return std::nullopt;
  }

  const auto path = NextPathLocked();
  try {
    WriteFileLocked(path, EncodeBatch(batch));
  } catch (const std::exception& e) {
    TSBATCH_LOG_ERROR("Staging write failed, batch dropped",
                      {StringField("path", path.string()), IntField("records", static_cast<std::int64_t>(batch.size())),
                       StringField("reason", ToString(reason)), StringField("error", e.what())});
    throw tsbatch::util::StagingError("failed to stage " + std::to_string(batch.size()) + " records to " + path.string() + ": " + e.what());
  }

  queue_.Enqueue(path);

  TSBATCH_LOG_INFO("Staged batch", {StringField("path", path.string()), IntField("records", static_cast<std::int64_t>(batch.size())),
                                    StringField("reason", ToString(reason))});

  return FlushResult{path, batch.size()};
}

/*
  <prefix>_<utc timestamp>_<sequence>.json

  The sequence keeps names unique when two flushes land in the same
  millisecond; an existing file is never overwritten.
*/
std::filesystem::path StagingWriter::NextPathLocked() {
  const auto stamp = tsbatch::util::FormatCompactUtc(tsbatch::util::Now());

  for (;;) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_%06llu.json", static_cast<unsigned long long>(++sequence_));

    auto candidate = options_.directory / (options_.file_prefix + "_" + stamp + suffix);
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
}

/*
  Atomic write:
      write tmp → fsync tmp → rename → fsync directory

  The fsync steps run only when StagingOptions::fsync is set.
*/
void StagingWriter::WriteFileLocked(const std::filesystem::path& final_path, const std::string& content) {
  const auto tmp_path = final_path.string() + ".tmp";

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(content.data(), static_cast<int64_t>(content.size())));

    if (options_.fsync && ::fsync(out->file_descriptor()) != 0) {
      const int error = errno;
      (void)out->Close();
      throw tsbatch::util::StagingError("fsync failed for " + tmp_path + ": " + std::strerror(error));
    }

    Unwrap(out->Close());

    std::filesystem::rename(tmp_path, final_path);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }

  if (options_.fsync) {
    SyncDirectory(final_path.parent_path());
  }
}

} // namespace tsbatch::staging
