#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "tsbatch/v1/ingest.pb.h"
#include "tsbatch/v1/remote.pb.h"

namespace tsbatch::intake {

// Upper bound on a decompressed remote-write body.
inline constexpr std::size_t kMaxDecodedBytes = 64u << 20;

/*
  Remote-write payload codec.

  Bodies are a serialized WriteRequest, either raw or snappy block
  compressed. Decode never returns a partial request: any failure throws
  util::DecodeError.
*/
tsbatch::v1::WriteRequest DecodeWriteRequest(std::string_view body, tsbatch::v1::PayloadEncoding encoding);

std::string EncodeWriteRequest(const tsbatch::v1::WriteRequest& request, tsbatch::v1::PayloadEncoding encoding);

std::string SnappyDecompress(std::string_view compressed);
std::string SnappyCompress(std::string_view raw);

} // namespace tsbatch::intake
