#include "interval_flusher.hpp"

#include "internal/buffer/intake_buffer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"

namespace tsbatch::pipeline {

IntervalFlusher::IntervalFlusher(std::chrono::milliseconds interval, const tsbatch::buffer::IntakeBuffer& buffer, FlushFn flush)
    : interval_(interval), buffer_(buffer), flush_(std::move(flush)) {}

IntervalFlusher::~IntervalFlusher() {
  Join();
}

void IntervalFlusher::Start(std::stop_token token) {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&IntervalFlusher::Run, this, std::move(token));
}

void IntervalFlusher::Join() {
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

void IntervalFlusher::Run(std::stop_token token) {
  while (tsbatch::util::SleepFor(token, interval_)) {
    if (buffer_.Size() == 0)
      continue;

    try {
      flush_();
    }
    catch (const std::exception& e) {
      TSBATCH_LOG_ERROR("Interval flush failed", {tsbatch::observability::StringField("error", e.what())});
    }
  }
}

} // namespace tsbatch::pipeline
