#include "arrow_ipc_loader.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/sink/arrow_utils.hpp"
#include "internal/staging/batch_codec.hpp"
#include "internal/util/errors.hpp"

namespace tsbatch::sink {

using tsbatch::observability::IntField;
using tsbatch::observability::StringField;

namespace {

void ValidatePathComponent(const std::string& value, const char* what) {
  if (value.empty()) {
    throw tsbatch::util::InvalidArgument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw tsbatch::util::InvalidArgument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw tsbatch::util::InvalidArgument(std::string(what) + " must not be a relative path component");
  }
}

std::string ReadWholeFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto size = Unwrap(file->GetSize());
  auto buf  = Unwrap(file->Read(size));
  Unwrap(file->Close());
  return buf->ToString();
}

// Metric name from __name__, remaining labels as sorted "k=v,k=v".
std::pair<std::string, std::string> SplitLabels(const tsbatch::v1::TimeSeries& series) {
  std::string                                      metric;
  std::vector<std::pair<std::string, std::string>> rest;
  for (const auto& label : series.labels()) {
    if (label.name() == "__name__") {
      metric = label.value();
    } else {
      rest.emplace_back(label.name(), label.value());
    }
  }
  std::sort(rest.begin(), rest.end());

  std::string joined;
  for (const auto& [name, value] : rest) {
    if (!joined.empty()) joined.push_back(',');
    joined.append(name).append("=").append(value);
  }
  return {std::move(metric), std::move(joined)};
}

std::shared_ptr<arrow::Table> BuildTable(const std::vector<tsbatch::v1::TimeSeries>& batch,
                                         const std::shared_ptr<const arrow::KeyValueMetadata>& metadata) {
  arrow::StringBuilder metric_builder;
  arrow::StringBuilder labels_builder;
  arrow::Int64Builder  ts_builder;
  arrow::DoubleBuilder value_builder;

  for (const auto& series : batch) {
    const auto [metric, labels] = SplitLabels(series);
    for (const auto& sample : series.samples()) {
      Unwrap(metric_builder.Append(metric));
      Unwrap(labels_builder.Append(labels));
      Unwrap(ts_builder.Append(sample.timestamp()));
      Unwrap(value_builder.Append(sample.value()));
    }
  }

  std::shared_ptr<arrow::Array> metric_array;
  std::shared_ptr<arrow::Array> labels_array;
  std::shared_ptr<arrow::Array> ts_array;
  std::shared_ptr<arrow::Array> value_array;
  Unwrap(metric_builder.Finish(&metric_array));
  Unwrap(labels_builder.Finish(&labels_array));
  Unwrap(ts_builder.Finish(&ts_array));
  Unwrap(value_builder.Finish(&value_array));

  auto schema = arrow::schema({arrow::field("metric", arrow::utf8(), false), arrow::field("labels", arrow::utf8(), false),
                               arrow::field("timestamp_ms", arrow::int64(), false), arrow::field("value", arrow::float64(), false)},
                              metadata);

  return arrow::Table::Make(std::move(schema), {metric_array, labels_array, ts_array, value_array});
}

void RemoveSource(const IngestRequest& request) {
  if (!request.delete_source_on_success) return;

  std::error_code ec;
  std::filesystem::remove(request.source_path, ec);
  if (ec) {
    TSBATCH_LOG_WARN("Failed to delete ingested source", {StringField("path", request.source_path.string()), StringField("error", ec.message())});
  }
}

} // namespace

ArrowIpcLoader::ArrowIpcLoader(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path ArrowIpcLoader::OutputPath(const DestinationDescriptor& destination, const std::string& correlation_id) const {
  ValidatePathComponent(destination.database, "destination database");
  ValidatePathComponent(destination.table, "destination table");
  ValidatePathComponent(correlation_id, "correlation id");
  return root_ / destination.database / destination.table / (correlation_id + ".arrow");
}

IngestResult ArrowIpcLoader::Ingest(const IngestRequest& request) {
  const auto output = OutputPath(request.destination, request.correlation_id);

  std::lock_guard lock(publish_mutex_);

  std::error_code ec;
  if (std::filesystem::exists(output, ec)) {
    RemoveSource(request);
    return {IngestStatus::kAlreadyIngested, "correlation id " + request.correlation_id + " already ingested"};
  }

  if (!std::filesystem::exists(request.source_path, ec)) {
    return {IngestStatus::kFailed, "source not found: " + request.source_path.string()};
  }

  try {
    const auto batch = tsbatch::staging::DecodeBatch(ReadWholeFile(request.source_path));

    auto metadata = arrow::KeyValueMetadata::Make({"correlation_id", "source_file", "mapping_name", "format"},
                                                  {request.correlation_id, request.source_path.filename().string(),
                                                   request.destination.mapping_name, request.destination.format});
    auto table = BuildTable(batch, metadata);

    std::filesystem::create_directories(output.parent_path());
    const auto tmp_path = output.string() + ".tmp";
    {
      auto out    = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
      auto writer = Unwrap(arrow::ipc::MakeFileWriter(out, table->schema()));
      Unwrap(writer->WriteTable(*table));
      Unwrap(writer->Close());
      Unwrap(out->Close());
    }
    std::filesystem::rename(tmp_path, output);

    TSBATCH_LOG_DEBUG("Arrow IPC load complete", {StringField("output", output.string()), IntField("rows", table->num_rows())});
  } catch (const std::exception& e) {
    std::filesystem::remove(output.string() + ".tmp", ec);
    return {IngestStatus::kFailed, e.what()};
  }

  RemoveSource(request);
  return {IngestStatus::kIngested, output.string()};
}

} // namespace tsbatch::sink
