#pragma once

#include <cstdint>
#include <string_view>

namespace tsbatch::ingest {

enum class UploadState : std::uint8_t {
  kPending           = 0,
  kUploading         = 1,
  kRetrying          = 2,
  kSucceeded         = 3,
  kPermanentlyFailed = 4,
  kMissing           = 5, // staging file vanished before an attempt
  kCancelled         = 6, // shutdown interrupted a retry backoff
};

constexpr bool IsTerminal(UploadState state) {
  return state == UploadState::kSucceeded || state == UploadState::kPermanentlyFailed || state == UploadState::kMissing ||
         state == UploadState::kCancelled;
}

constexpr bool CanTransition(UploadState from, UploadState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case UploadState::kPending:
      return to == UploadState::kUploading || to == UploadState::kMissing;
    case UploadState::kUploading:
      return to == UploadState::kSucceeded || to == UploadState::kRetrying || to == UploadState::kPermanentlyFailed;
    case UploadState::kRetrying:
      return to == UploadState::kUploading || to == UploadState::kMissing || to == UploadState::kCancelled;
    default:
      return false;
  }
}

constexpr std::string_view ToString(UploadState state) {
  switch (state) {
    case UploadState::kPending:
      return "pending";
    case UploadState::kUploading:
      return "uploading";
    case UploadState::kRetrying:
      return "retrying";
    case UploadState::kSucceeded:
      return "succeeded";
    case UploadState::kPermanentlyFailed:
      return "permanently_failed";
    case UploadState::kMissing:
      return "missing";
    case UploadState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

} // namespace tsbatch::ingest
