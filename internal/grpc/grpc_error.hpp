#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace coord::grpc {

/*
  coord::util exception -> gRPC status.

    NOT_FOUND           unknown project or message
    INVALID_ARGUMENT    missing or malformed field
    ABORTED             lock held by another agent
    PERMISSION_DENIED   unlock by non-owner, ack by non-recipient
    UNAVAILABLE         store busy (retry as-is)
    INTERNAL            anything else

  error_details carries a serialized coord.v1.ErrorDetail with the same code
  and details the JSON tools report.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace coord::grpc
