#include "grpc_error.hpp"

#include <string_view>

#include "internal/service/error_detail.hpp"

namespace coord::grpc {

namespace {

::grpc::StatusCode CodeFor(std::string_view code, const coord::v1::ErrorDetail& detail) {
  if (code == "PROJECT_NOT_FOUND" || code == "MESSAGE_NOT_FOUND") return ::grpc::StatusCode::NOT_FOUND;
  if (code == "AGENT_REQUIRED_FIELD_MISSING" || code == "INVALID_ARGUMENT") return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (code == "LOCK_CONFLICT") return ::grpc::StatusCode::ABORTED;
  if (code == "UNLOCK_NOT_OWNER" || code == "MESSAGE_WRONG_RECIPIENT") return ::grpc::StatusCode::PERMISSION_DENIED;
  if (code == "STORE_ERROR") {
    const auto& fields = detail.details().fields();
    auto        it     = fields.find("retryable");
    if (it != fields.end() && it->second.bool_value()) return ::grpc::StatusCode::UNAVAILABLE;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  const auto described = coord::service::DescribeError(e);
  return {CodeFor(described.detail.code(), described.detail), described.message, described.detail.SerializeAsString()};
}

} // namespace coord::grpc
