#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace provgate::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace provgate::grpc
