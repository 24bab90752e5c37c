#include "intake_buffer.hpp"

#include <utility>

namespace tsbatch::buffer {

void IntakeBuffer::Enqueue(tsbatch::v1::TimeSeries record) {
  std::lock_guard lock(mutex_);
  records_.push_back(std::move(record));
  size_.store(records_.size(), std::memory_order_release);
}

Batch IntakeBuffer::DrainAll() {
  Batch drained;
  {
    std::lock_guard lock(mutex_);
    drained.swap(records_);
    size_.store(0, std::memory_order_release);
  }
  return drained;
}

} // namespace tsbatch::buffer
