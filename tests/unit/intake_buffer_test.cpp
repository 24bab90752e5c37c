#include "internal/buffer/intake_buffer.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "tests/unit/fake_bulk_loader.hpp"

namespace {

using tsbatch::buffer::Batch;
using tsbatch::buffer::IntakeBuffer;
using tsbatch::testing::MakeSeries;
using tsbatch::testing::SeriesId;

void TestDrainOnEmptyBufferReturnsEmptyBatch() {
  IntakeBuffer buffer;
  assert(buffer.Size() == 0);
  assert(buffer.DrainAll().empty());
  assert(buffer.DrainAll().empty());
}

void TestDrainPreservesEnqueueOrder() {
  IntakeBuffer buffer;
  for (int i = 0; i < 10; ++i) {
    buffer.Enqueue(MakeSeries("up", std::to_string(i)));
  }
  assert(buffer.Size() == 10);

  const auto batch = buffer.DrainAll();
  assert(batch.size() == 10);
  for (int i = 0; i < 10; ++i) {
    assert(SeriesId(batch[i]) == std::to_string(i));
  }
  assert(buffer.Size() == 0);
}

void TestConcurrentEnqueueAndDrainDeliversEveryRecordOnce() {
  constexpr int kProducers   = 8;
  constexpr int kPerProducer = 2000;

  IntakeBuffer             buffer;
  std::atomic<int>         producers_done{0};
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        buffer.Enqueue(MakeSeries("load", std::to_string(p) + ":" + std::to_string(i)));
      }
      producers_done.fetch_add(1);
    });
  }

  std::vector<Batch> drains;
  while (producers_done.load() < kProducers) {
    drains.push_back(buffer.DrainAll());
  }
  for (auto& t : producers) t.join();
  drains.push_back(buffer.DrainAll());

  std::set<std::string> seen;
  std::size_t           total = 0;
  for (const auto& batch : drains) {
    // Per-producer order survives inside a drain.
    std::vector<int> last(kProducers, -1);
    for (const auto& series : batch) {
      const auto id    = SeriesId(series);
      const auto colon = id.find(':');
      const int  p     = std::stoi(id.substr(0, colon));
      const int  i     = std::stoi(id.substr(colon + 1));
      assert(i > last[p]);
      last[p] = i;

      assert(seen.insert(id).second);
      ++total;
    }
  }

  assert(total == static_cast<std::size_t>(kProducers * kPerProducer));
  assert(buffer.Size() == 0);
}

} // namespace

int main() {
  TestDrainOnEmptyBufferReturnsEmptyBatch();
  TestDrainPreservesEnqueueOrder();
  TestConcurrentEnqueueAndDrainDeliversEveryRecordOnce();

  std::cout << "tsbatch_unit_intake_buffer: pass\n";
  return 0;
}
