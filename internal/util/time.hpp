#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace provgate::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 UTC with microseconds, e.g. 2026-01-02T03:04:05.000006Z
std::string FormatUtc(TimePoint tp);
TimePoint   ParseUtc(const std::string& text);

/*
  UTC clock that never goes backwards.

  Two reads from the same instance are strictly increasing (microsecond
  resolution), so receipts sealed through one generator keep stage order
  even if the wall clock steps back.
*/
class MonotonicUtcClock {
 public:
  TimePoint Now();

 private:
  std::mutex mutex_;
  TimePoint  last_{};
};

} // namespace provgate::util
