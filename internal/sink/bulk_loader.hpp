#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace tsbatch::sink {

/*
  Where a staged batch ends up in the analytics sink.
*/
struct DestinationDescriptor {
  std::string database;
  std::string table;
  std::string mapping_name;
  std::string format{"multijson"};
};

struct IngestRequest {
  std::filesystem::path source_path;
  DestinationDescriptor destination;
  std::string           correlation_id;
  bool                  delete_source_on_success = true;
};

enum class IngestStatus {
  kIngested,
  kAlreadyIngested, // correlation id was completed by an earlier attempt
  kFailed,
};

struct IngestResult {
  IngestStatus status = IngestStatus::kFailed;
  std::string  message;

  bool ok() const {
    return status != IngestStatus::kFailed;
  }
};

/*
  Sink-side bulk load capability.

  Implementations must recognize a correlation id they have already
  completed and must not apply that batch twice. Failures are reported
  either as a kFailed result or by throwing; callers treat both the same.
*/
class BulkLoader {
 public:
  virtual ~BulkLoader() = default;

  virtual IngestResult Ingest(const IngestRequest& request) = 0;
};

using BulkLoaderPtr = std::shared_ptr<BulkLoader>;

} // namespace tsbatch::sink
