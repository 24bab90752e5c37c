#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <iostream>
#include <string>

#include "client/cpp/remote_write_client.h"
#include "internal/util/time.hpp"
#include "tsbatch/v1.hpp"

int main(int argc, char** argv) {
  // Allow optional endpoint override for local/remote diagnostics.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  tsbatch::client::RemoteWriteClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  const auto now_ms = static_cast<int64_t>(tsbatch::util::ToUnixMillis(tsbatch::util::Now()));

  // Two series, three samples each, sent snappy-compressed like a remote-write agent.
  tsbatch::v1::WriteRequest request;
  for (const char* instance : {"node-a:9100", "node-b:9100"}) {
    auto* series = request.add_timeseries();

    auto* name = series->add_labels();
    name->set_name("__name__");
    name->set_value("node_load1");

    auto* label = series->add_labels();
    label->set_name("instance");
    label->set_value(instance);

    for (int i = 0; i < 3; ++i) {
      auto* sample = series->add_samples();
      sample->set_timestamp(now_ms - (2 - i) * 15000);
      sample->set_value(0.25 * (i + 1));
    }
  }

  auto written = client.WriteEncoded(request);
  if (!written.ok()) {
    std::cerr << "WriteEncoded failed: " << written.status().ToString() << '\n';
    return 1;
  }
  std::cout << "accepted " << written->accepted_series() << " series\n";

  // Force the buffer to a staging file instead of waiting for the interval.
  auto flushed = client.Flush();
  if (!flushed.ok()) {
    std::cerr << "Flush failed: " << flushed.status().ToString() << '\n';
    return 1;
  }
  std::cout << (flushed->staged() ? "staged " + flushed->path() : std::string("nothing to stage")) << '\n';

  auto stats = client.Stats();
  if (!stats.ok()) {
    std::cerr << "Stats failed: " << stats.status().ToString() << '\n';
    return 1;
  }
  std::cout << "records_enqueued=" << stats->records_enqueued() << ", files_staged=" << stats->files_staged()
            << ", uploads_succeeded=" << stats->uploads_succeeded() << '\n';

  return 0;
}
