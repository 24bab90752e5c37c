#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

#include "tsbatch/v1/remote.pb.h"

namespace tsbatch::buffer {

using Batch = std::vector<tsbatch::v1::TimeSeries>;

/*
  Concurrent append buffer of decoded time series waiting to be staged.

  Enqueue never fails. DrainAll hands back everything queued so far, in
  enqueue order, and leaves the buffer empty; a record lands in exactly
  one drain.
*/
class IntakeBuffer {
 public:
  void Enqueue(tsbatch::v1::TimeSeries record);

  // Approximate; safe to call concurrently with Enqueue/DrainAll.
  std::size_t Size() const noexcept {
    return size_.load(std::memory_order_acquire);
  }

  Batch DrainAll();

 private:
  std::mutex               mutex_;
  Batch                    records_;
  std::atomic<std::size_t> size_{0};
};

} // namespace tsbatch::buffer
