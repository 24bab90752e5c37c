#include "ingestion_queue.hpp"

namespace tsbatch::ingest {

void IngestionQueue::Enqueue(const std::filesystem::path& path) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(path);
  }
  cv_.notify_one();
}

std::optional<std::filesystem::path> IngestionQueue::Dequeue(std::stop_token token) {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, token, [&] { return !queue_.empty(); });

  // Paths still queued at stop stay on disk for the next start.
  if (token.stop_requested() || queue_.empty()) return std::nullopt;

  auto path = std::move(queue_.front());
  queue_.pop();
  return path;
}

std::optional<std::filesystem::path> IngestionQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (queue_.empty()) return std::nullopt;

  auto path = std::move(queue_.front());
  queue_.pop();
  return path;
}

std::size_t IngestionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace tsbatch::ingest
