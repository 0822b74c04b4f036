#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace coord::util {

TimePoint ManualTimeSource::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualTimeSource::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

void ManualTimeSource::Advance(std::chrono::milliseconds delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

std::shared_ptr<TimeSource> SystemTime() {
  static const auto source = std::make_shared<SystemTimeSource>();
  return source;
}

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1000000));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t unix_ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(unix_ms));
}

std::string FormatMillis(uint64_t unix_ms) {
  return google::protobuf::util::TimeUtil::ToString(MillisToProto(unix_ms));
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = google::protobuf::util::TimeUtil::DurationToMilliseconds(d);
  return ms > 0 ? std::chrono::milliseconds(ms) : fallback;
}

} // namespace coord::util
