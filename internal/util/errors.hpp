#pragma once

#include <stdexcept>
#include <string>

namespace tsbatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Inbound payload could not be decompressed or parsed.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A drained batch could not be serialized or written to the staging area.
class StagingError : public std::runtime_error {
 public:
  explicit StagingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tsbatch::util
