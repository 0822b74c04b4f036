#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace coord::core {

// Raises a failed store result as util::StoreError ("<context>: <code>: <detail>").
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + std::string(db::ToString(result.code));
  if (!result.message.empty()) message += ": " + result.message;
  throw util::StoreError(message, result.Retryable());
}

} // namespace coord::core
