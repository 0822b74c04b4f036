#pragma once

#include <cstdint>

#include "internal/db/model/lock_record.hpp"

namespace coord::lock {

/*
  Soft lease checks. Every reader calls these against the current time; no
  timer ever expires a lock on its own.
*/

// A lease is live while now < expires_at; at expires_at it is gone.
inline bool IsExpired(const db::model::LockRecord& lock, uint64_t now_ms) {
  return lock.expires_at_ms <= now_ms;
}

inline uint64_t RemainingMs(const db::model::LockRecord& lock, uint64_t now_ms) {
  return IsExpired(lock, now_ms) ? 0 : lock.expires_at_ms - now_ms;
}

} // namespace coord::lock
