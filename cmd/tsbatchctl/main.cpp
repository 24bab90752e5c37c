#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include "client/cpp/remote_write_client.h"
#include "internal/util/time.hpp"
#include "tsbatch/v1.hpp"

using namespace tsbatch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tsbatchctl <addr> push <metric> <value> [label=value ...]\n"
            << "  tsbatchctl <addr> push-file <path> [encoding=snappy|identity]\n"
            << "  tsbatchctl <addr> flush\n"
            << "  tsbatchctl <addr> stats\n";
}

static std::optional<PayloadEncoding> ParseEncoding(const std::string& value) {
  if (value == "snappy") {
    return PAYLOAD_ENCODING_SNAPPY;
  }
  if (value == "identity") {
    return PAYLOAD_ENCODING_IDENTITY;
  }
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  tsbatch::client::RemoteWriteClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "push") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    double value = 0;
    try {
      value = std::stod(argv[4]);
    } catch (const std::exception&) {
      std::cerr << "invalid sample value: " << argv[4] << "\n";
      return 1;
    }

    WriteRequest req;
    auto*        series = req.add_timeseries();

    auto* name = series->add_labels();
    name->set_name("__name__");
    name->set_value(argv[3]);

    for (int i = 5; i < argc; ++i) {
      std::string pair = argv[i];
      auto        eq   = pair.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "invalid label (expected name=value): " << pair << "\n";
        return 1;
      }
      auto* label = series->add_labels();
      label->set_name(pair.substr(0, eq));
      label->set_value(pair.substr(eq + 1));
    }

    auto* sample = series->add_samples();
    sample->set_value(value);
    sample->set_timestamp(static_cast<int64_t>(tsbatch::util::ToUnixMillis(tsbatch::util::Now())));

    auto result = client.WriteEncoded(req);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }

    std::cout << "accepted=" << result->accepted_series() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "push-file") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    PayloadEncoding encoding = PAYLOAD_ENCODING_SNAPPY;
    if (argc >= 5) {
      auto parsed = ParseEncoding(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported encoding: " << argv[4] << "\n";
        return 1;
      }
      encoding = parsed.value();
    }

    std::ifstream in(argv[3], std::ios::binary);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = client.WriteRaw(std::move(body), encoding);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }

    std::cout << "accepted=" << result->accepted_series() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "flush") {
    auto result = client.Flush();
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }

    if (result->staged()) {
      std::cout << "staged=" << result->path() << "\n";
    } else {
      std::cout << "staged=none\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    auto result = client.Stats();
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }

    const auto& resp = *result;
    std::cout << "records_enqueued=" << resp.records_enqueued() << "\n";
    std::cout << "flushes=" << resp.flushes() << "\n";
    std::cout << "files_staged=" << resp.files_staged() << "\n";
    std::cout << "records_staged=" << resp.records_staged() << "\n";
    std::cout << "staging_failures=" << resp.staging_failures() << "\n";
    std::cout << "upload_attempts=" << resp.upload_attempts() << "\n";
    std::cout << "uploads_succeeded=" << resp.uploads_succeeded() << "\n";
    std::cout << "uploads_already_ingested=" << resp.uploads_already_ingested() << "\n";
    std::cout << "uploads_failed_permanently=" << resp.uploads_failed_permanently() << "\n";
    std::cout << "files_missing=" << resp.files_missing() << "\n";
    std::cout << "buffer_depth=" << resp.buffer_depth() << "\n";
    std::cout << "queue_depth=" << resp.queue_depth() << "\n";
    std::cout << "inflight_correlation_ids=" << resp.inflight_correlation_ids() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
