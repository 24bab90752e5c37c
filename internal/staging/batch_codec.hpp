#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tsbatch/v1/remote.pb.h"

namespace tsbatch::staging {

/*
  Staging file format: one TimeSeries per line, protobuf canonical JSON
  ("multijson"). Non-finite sample values are written as "NaN",
  "Infinity" and "-Infinity".
*/

std::string EncodeBatch(const std::vector<tsbatch::v1::TimeSeries>& batch);

// Throws util::DecodeError on a malformed line. Blank lines are skipped.
std::vector<tsbatch::v1::TimeSeries> DecodeBatch(std::string_view content);

} // namespace tsbatch::staging
