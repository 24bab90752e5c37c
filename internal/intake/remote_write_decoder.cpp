#include "remote_write_decoder.hpp"

#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>

#include "internal/sink/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace tsbatch::intake {

using tsbatch::sink::Unwrap;
using tsbatch::util::DecodeError;

namespace {

std::unique_ptr<arrow::util::Codec> MakeSnappyCodec() {
  return Unwrap(arrow::util::Codec::Create(arrow::Compression::SNAPPY));
}

/*
  Snappy block format starts with the uncompressed length as a
  little-endian base-128 varint.
*/
uint64_t ReadUncompressedLength(std::string_view compressed) {
  uint64_t result = 0;
  int      shift  = 0;

  for (std::size_t i = 0; i < compressed.size() && i < 5; ++i) {
    const auto byte = static_cast<uint8_t>(compressed[i]);
    result |= static_cast<uint64_t>(byte & 0x7f) << shift;
    if ((byte & 0x80) == 0) {
      return result;
    }
    shift += 7;
  }

  throw DecodeError("snappy: malformed length preamble");
}

} // namespace

std::string SnappyDecompress(std::string_view compressed) {
  if (compressed.empty()) {
    throw DecodeError("snappy: empty body");
  }

  const auto length = ReadUncompressedLength(compressed);
  if (length > kMaxDecodedBytes) {
    throw DecodeError("snappy: decoded length " + std::to_string(length) + " exceeds limit");
  }

  std::string out(static_cast<std::size_t>(length), '\0');
  try {
    auto codec   = MakeSnappyCodec();
    auto written = Unwrap(codec->Decompress(static_cast<int64_t>(compressed.size()), reinterpret_cast<const uint8_t*>(compressed.data()),
                                            static_cast<int64_t>(out.size()), reinterpret_cast<uint8_t*>(out.data())));
    out.resize(static_cast<std::size_t>(written));
  } catch (const std::exception& e) {
    throw DecodeError(std::string("snappy: ") + e.what());
  }
  return out;
}

std::string SnappyCompress(std::string_view raw) {
  auto       codec = MakeSnappyCodec();
  const auto input = reinterpret_cast<const uint8_t*>(raw.data());

  std::string out(static_cast<std::size_t>(codec->MaxCompressedLen(static_cast<int64_t>(raw.size()), input)), '\0');
  auto        written =
      Unwrap(codec->Compress(static_cast<int64_t>(raw.size()), input, static_cast<int64_t>(out.size()), reinterpret_cast<uint8_t*>(out.data())));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

tsbatch::v1::WriteRequest DecodeWriteRequest(std::string_view body, tsbatch::v1::PayloadEncoding encoding) {
  std::string raw;
  switch (encoding) {
    case tsbatch::v1::PAYLOAD_ENCODING_UNSPECIFIED:
    case tsbatch::v1::PAYLOAD_ENCODING_SNAPPY:
      raw = SnappyDecompress(body);
      break;
    case tsbatch::v1::PAYLOAD_ENCODING_IDENTITY:
      if (body.size() > kMaxDecodedBytes) {
        throw DecodeError("remote write body exceeds limit");
      }
      raw.assign(body.data(), body.size());
      break;
    default:
      throw DecodeError("unsupported payload encoding " + std::to_string(static_cast<int>(encoding)));
  }

  tsbatch::v1::WriteRequest request;
  if (!request.ParseFromString(raw)) {
    throw DecodeError("remote write body is not a valid WriteRequest");
  }
  return request;
}

std::string EncodeWriteRequest(const tsbatch::v1::WriteRequest& request, tsbatch::v1::PayloadEncoding encoding) {
  std::string raw;
  if (!request.SerializeToString(&raw)) {
    throw tsbatch::util::InvalidArgument("failed to serialize WriteRequest");
  }

  if (encoding == tsbatch::v1::PAYLOAD_ENCODING_IDENTITY) {
    return raw;
  }
  return SnappyCompress(raw);
}

} // namespace tsbatch::intake
