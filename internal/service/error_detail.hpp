#pragma once

#include <exception>
#include <string>

#include "coord/v1.hpp"

namespace coord::service {

struct ErrorDescription {
  coord::v1::ErrorDetail detail; // code + details
  std::string            message;
};

/*
  Names the failure behind a coord::util exception:

    PROJECT_NOT_FOUND          AGENT_REQUIRED_FIELD_MISSING  INVALID_ARGUMENT
    LOCK_CONFLICT              UNLOCK_NOT_OWNER              MESSAGE_NOT_FOUND
    MESSAGE_WRONG_RECIPIENT    STORE_ERROR                   INTERNAL

  details carries what the caller needs to act: the lock holder and its
  remaining time, the field that was missing, whether a store error may be
  retried. Anything unrecognised is INTERNAL.
*/
ErrorDescription DescribeError(const std::exception& e);

} // namespace coord::service
