#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

namespace tsbatch::buffer {
class IntakeBuffer;
}

namespace tsbatch::pipeline {

/*
  Time-based flush trigger.

  Wakes every `interval` and calls `flush` when the buffer holds anything.
  The wait ends immediately on stop.
*/
class IntervalFlusher {
 public:
  using FlushFn = std::function<void()>;

  IntervalFlusher(std::chrono::milliseconds interval, const tsbatch::buffer::IntakeBuffer& buffer, FlushFn flush);
  ~IntervalFlusher();

  IntervalFlusher(const IntervalFlusher&)            = delete;
  IntervalFlusher& operator=(const IntervalFlusher&) = delete;

  void Start(std::stop_token token);
  void Join();

 private:
  void Run(std::stop_token token);

  std::chrono::milliseconds            interval_;
  const tsbatch::buffer::IntakeBuffer& buffer_;
  FlushFn                              flush_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace tsbatch::pipeline
