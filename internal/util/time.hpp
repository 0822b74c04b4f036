#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/timestamp.pb.h>

namespace coord::util {

/*
  Time utilities — single place to control the clock source.

  Every expiry decision (lease, staleness, message TTL) compares against
  TimeSource::Now() at access time; nothing runs on a timer.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Latest instant a google.protobuf.Timestamp can carry (9999-12-31T23:59:59.999Z).
inline constexpr uint64_t kMaxTimestampMillis = 253402300799999;

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override {
    return Clock::now();
  }
};

// Settable clock for deterministic expiry in tests and replay tools.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start = Clock::now()) : now_(start) {
  }

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

std::shared_ptr<TimeSource> SystemTime();

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t unix_ms);

// RFC3339 rendering used in log lines and error messages.
std::string FormatMillis(uint64_t unix_ms);

// Duration config helper: unset or non-positive durations fall back.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace coord::util
