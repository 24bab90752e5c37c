#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tsbatch::ingest {

/*
  Staging file path -> correlation id of its upload.

  An id is created on first use and stays the same for every retry of the
  file until Release is called.
*/
class IdempotencyCache {
 public:
  std::string GetOrCreate(const std::string& file_path);

  std::optional<std::string> Get(const std::string& file_path) const;

  // Returns false if no id was bound to the path.
  bool Release(const std::string& file_path);

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, std::string> ids_;
};

} // namespace tsbatch::ingest
