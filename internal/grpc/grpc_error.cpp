#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace tsbatch::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace tsbatch::util;

  if (dynamic_cast<const DecodeError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const StagingError*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace tsbatch::grpc
