#include "grpc_error.hpp"

namespace provgate::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace provgate::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const InvalidParentError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PolicyViolationError*>(&e) || dynamic_cast<const RevokedEntityError*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const SigningUnavailableError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const ProofVerificationError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const StageAbortedError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace provgate::grpc
