#include "batch_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace tsbatch::staging {

std::string EncodeBatch(const std::vector<tsbatch::v1::TimeSeries>& batch) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = false;
  options.preserve_proto_field_names    = true;

  std::string out;
  std::string line;
  for (const auto& series : batch) {
    line.clear();
    auto status = google::protobuf::util::MessageToJsonString(series, &line, options);
    if (!status.ok()) {
      throw tsbatch::util::StagingError("failed to serialize time series: " + std::string(status.message()));
    }
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

std::vector<tsbatch::v1::TimeSeries> DecodeBatch(std::string_view content) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  std::vector<tsbatch::v1::TimeSeries> batch;

  std::size_t line_no = 0;
  std::size_t pos     = 0;
  while (pos < content.size()) {
    auto end = content.find('\n', pos);
    if (end == std::string_view::npos) end = content.size();

    auto line = content.substr(pos, end - pos);
    pos       = end + 1;
    ++line_no;

    if (line.find_first_not_of(" \t\r") == std::string_view::npos) continue;

    tsbatch::v1::TimeSeries series;
    auto status = google::protobuf::util::JsonStringToMessage(std::string(line), &series, options);
    if (!status.ok()) {
      throw tsbatch::util::DecodeError("line " + std::to_string(line_no) + ": " + std::string(status.message()));
    }
    batch.push_back(std::move(series));
  }
  return batch;
}

} // namespace tsbatch::staging
