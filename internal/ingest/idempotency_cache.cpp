#include "idempotency_cache.hpp"

#include <mutex>

#include "internal/util/uuid.hpp"

namespace tsbatch::ingest {

// ------------------------------------------------------------
// GetOrCreate
// ------------------------------------------------------------

std::string IdempotencyCache::GetOrCreate(const std::string& file_path) {
  {
    std::shared_lock lock(mutex_);
    auto it = ids_.find(file_path);
    if (it != ids_.end())
      return it->second;
  }

  std::unique_lock lock(mutex_);

  // another caller may have won the race between the two locks
  auto [it, inserted] = ids_.try_emplace(file_path);
  if (inserted)
    it->second = tsbatch::util::GenerateUUIDString();

  return it->second;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::string>
IdempotencyCache::Get(const std::string& file_path) const {
  std::shared_lock lock(mutex_);

  auto it = ids_.find(file_path);
  if (it == ids_.end())
    return std::nullopt;

  return it->second;
}

// ------------------------------------------------------------
// Release
// ------------------------------------------------------------

bool IdempotencyCache::Release(const std::string& file_path) {
  std::unique_lock lock(mutex_);
  return ids_.erase(file_path) > 0;
}

std::size_t IdempotencyCache::Size() const {
  std::shared_lock lock(mutex_);
  return ids_.size();
}

} // namespace tsbatch::ingest
