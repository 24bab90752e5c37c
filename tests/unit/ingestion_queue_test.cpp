#include "internal/ingest/ingestion_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <stop_token>
#include <thread>

namespace {

using tsbatch::ingest::IngestionQueue;

void TestFifoOrder() {
  IngestionQueue queue;
  queue.Enqueue("a.json");
  queue.Enqueue("b.json");
  queue.Enqueue("c.json");
  assert(queue.Size() == 3);

  std::stop_source stop;
  assert(queue.Dequeue(stop.get_token()).value() == "a.json");
  assert(queue.TryDequeue().value() == "b.json");
  assert(queue.Dequeue(stop.get_token()).value() == "c.json");
  assert(!queue.TryDequeue().has_value());
}

void TestDequeueBlocksUntilEnqueue() {
  IngestionQueue   queue;
  std::stop_source stop;

  std::optional<std::filesystem::path> got;
  std::thread consumer([&] { got = queue.Dequeue(stop.get_token()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.Enqueue("late.json");
  consumer.join();

  assert(got.has_value() && *got == "late.json");
}

void TestStopWakesBlockedDequeuePromptly() {
  IngestionQueue   queue;
  std::stop_source stop;

  std::optional<std::filesystem::path> got = std::filesystem::path("sentinel");
  const auto                           started = std::chrono::steady_clock::now();
  std::thread consumer([&] { got = queue.Dequeue(stop.get_token()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  stop.request_stop();
  consumer.join();

  assert(!got.has_value());
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
}

void TestStoppedDequeueLeavesPathsQueued() {
  IngestionQueue queue;
  queue.Enqueue("kept.json");

  std::stop_source stop;
  stop.request_stop();
  assert(!queue.Dequeue(stop.get_token()).has_value());
  assert(queue.Size() == 1);
}

} // namespace

int main() {
  TestFifoOrder();
  TestDequeueBlocksUntilEnqueue();
  TestStopWakesBlockedDequeuePromptly();
  TestStoppedDequeueLeavesPathsQueued();

  std::cout << "tsbatch_unit_ingestion_queue: pass\n";
  return 0;
}
