#include "internal/intake/remote_write_decoder.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/unit/fake_bulk_loader.hpp"

namespace {

using namespace tsbatch::v1;
using tsbatch::intake::DecodeWriteRequest;
using tsbatch::intake::EncodeWriteRequest;
using tsbatch::testing::MakeSeries;
using tsbatch::testing::SeriesId;

WriteRequest SampleRequest() {
  WriteRequest request;
  *request.add_timeseries() = MakeSeries("node_cpu_seconds_total", "cpu0", 12.5, 1700000000000);
  *request.add_timeseries() = MakeSeries("node_cpu_seconds_total", "cpu1", 13.5, 1700000000000);
  return request;
}

template <typename Fn>
bool ThrowsDecodeError(Fn&& fn) {
  try {
    fn();
  } catch (const tsbatch::util::DecodeError&) {
    return true;
  }
  return false;
}

void TestSnappyBodyDecodes() {
  const auto body = EncodeWriteRequest(SampleRequest(), PAYLOAD_ENCODING_SNAPPY);

  std::string raw;
  SampleRequest().SerializeToString(&raw);
  assert(body != raw);

  const auto decoded = DecodeWriteRequest(body, PAYLOAD_ENCODING_SNAPPY);
  assert(decoded.timeseries_size() == 2);
  assert(SeriesId(decoded.timeseries(1)) == "cpu1");
  assert(decoded.timeseries(1).samples(0).value() == 13.5);

  // Unspecified encoding means snappy.
  assert(DecodeWriteRequest(body, PAYLOAD_ENCODING_UNSPECIFIED).timeseries_size() == 2);
}

void TestIdentityBodyDecodes() {
  const auto body    = EncodeWriteRequest(SampleRequest(), PAYLOAD_ENCODING_IDENTITY);
  const auto decoded = DecodeWriteRequest(body, PAYLOAD_ENCODING_IDENTITY);
  assert(decoded.timeseries_size() == 2);
  assert(SeriesId(decoded.timeseries(0)) == "cpu0");
}

void TestEmptyIdentityBodyIsAnEmptyRequest() {
  assert(DecodeWriteRequest("", PAYLOAD_ENCODING_IDENTITY).timeseries_size() == 0);
}

void TestMalformedBodiesAreRejected() {
  // Not snappy: truncated length preamble.
  assert(ThrowsDecodeError([] { (void)DecodeWriteRequest(std::string("\xff\xff", 2), PAYLOAD_ENCODING_SNAPPY); }));
  // Snappy preamble claiming more than the limit.
  assert(ThrowsDecodeError([] { (void)DecodeWriteRequest(std::string("\xff\xff\xff\xff\x0f", 5), PAYLOAD_ENCODING_SNAPPY); }));
  // Valid preamble, corrupt block.
  assert(ThrowsDecodeError([] { (void)DecodeWriteRequest(std::string("\x0a\xff\xff\xff", 4), PAYLOAD_ENCODING_SNAPPY); }));
  assert(ThrowsDecodeError([] { (void)DecodeWriteRequest("", PAYLOAD_ENCODING_SNAPPY); }));
  // Length-delimited field 1 that runs past the end of the body.
  assert(ThrowsDecodeError([] { (void)DecodeWriteRequest(std::string("\x0a\x05" "ab", 4), PAYLOAD_ENCODING_IDENTITY); }));
  assert(ThrowsDecodeError([] { (void)DecodeWriteRequest("x", static_cast<PayloadEncoding>(42)); }));
}

} // namespace

int main() {
  TestSnappyBodyDecodes();
  TestIdentityBodyDecodes();
  TestEmptyIdentityBodyIsAnEmptyRequest();
  TestMalformedBodiesAreRejected();

  std::cout << "tsbatch_unit_remote_write_decoder: pass\n";
  return 0;
}
