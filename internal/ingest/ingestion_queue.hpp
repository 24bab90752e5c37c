#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>

namespace tsbatch::ingest {

/*
  Thread-safe FIFO of staged files waiting for upload.
*/
class IngestionQueue {
 public:
  void Enqueue(const std::filesystem::path& path);

  // Blocks until a path is available. Returns nothing once `token` is stopped.
  std::optional<std::filesystem::path> Dequeue(std::stop_token token);

  std::optional<std::filesystem::path> TryDequeue();

  std::size_t Size() const;

 private:
  mutable std::mutex                mutex_;
  std::condition_variable_any       cv_;
  std::queue<std::filesystem::path> queue_;
};

} // namespace tsbatch::ingest
