#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace provgate::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  return ms.count() > 0 ? ms : fallback;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatUtc(TimePoint tp) {
  const auto        ts   = ToProto(tp);
  const std::time_t secs = static_cast<std::time_t>(ts.seconds());
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << ts.nanos() / 1000 << 'Z';
  return out.str();
}

TimePoint ParseUtc(const std::string& text) {
  std::tm            utc{};
  std::istringstream in(text);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    throw std::runtime_error("Invalid UTC timestamp: " + text);
  }

  auto tp = Clock::from_time_t(timegm(&utc));

  if (in.peek() == '.') {
    in.get();
    std::string digits;
    while (std::isdigit(in.peek())) {
      digits.push_back(static_cast<char>(in.get()));
    }
    digits.resize(9, '0');
    tp += std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(std::stoll(digits)));
  }
  return tp;
}

TimePoint MonotonicUtcClock::Now() {
  std::lock_guard lock(mutex_);
  auto            now = std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
  if (now <= last_) {
    now = std::chrono::time_point_cast<std::chrono::microseconds>(last_ + std::chrono::microseconds(1));
  }
  last_ = now;
  return now;
}

} // namespace provgate::util
