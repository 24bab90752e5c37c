#pragma once

#include <filesystem>
#include <mutex>

#include "internal/sink/bulk_loader.hpp"

namespace tsbatch::sink {

/*
  Local columnar sink using Arrow IPC files.

  Layout:
      <root>/<database>/<table>/<correlation_id>.arrow

  One row per sample: metric, labels, timestamp_ms, value. The output file
  name doubles as the record of a completed correlation id, so a retried
  upload of the same batch is acknowledged without being written again.
*/
class ArrowIpcLoader final : public BulkLoader {
 public:
  explicit ArrowIpcLoader(std::filesystem::path root);

  IngestResult Ingest(const IngestRequest& request) override;

  std::filesystem::path OutputPath(const DestinationDescriptor& destination, const std::string& correlation_id) const;

 private:
  std::filesystem::path root_;

  // Serializes the exists-check and publish of one output file.
  std::mutex publish_mutex_;
};

} // namespace tsbatch::sink
