#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::grpc {

/*
  Converts internal exceptions into gRPC status codes. The stable
  ErrorCode name is carried in the status details.
*/

::grpc::Status ToStatus(const std::exception& e);

dispatch::core::v1::ErrorCode ToErrorCode(const std::exception& e);

} // namespace dispatch::grpc
