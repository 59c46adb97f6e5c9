#include "time.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace routebroker::util {

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

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

int64_t UtcDayNumber(TimePoint tp) {
  return std::chrono::floor<Days>(tp.time_since_epoch()).count();
}

TimePoint StartOfUtcDay(TimePoint tp) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(Days(UtcDayNumber(tp)));
}

TimePoint EndOfUtcDay(TimePoint tp) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(Days(UtcDayNumber(tp) + 1));
}

TimePoint ParseCompactUtc(const std::string& value) {
  std::tm            tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y%m%dT%H%M%S");
  if (in.fail() || value.size() != 15) {
    throw std::invalid_argument("invalid timestamp '" + value + "', expected YYYYMMDDTHHMMSS");
  }
  return Clock::from_time_t(timegm(&tm));
}

std::string FormatUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string FormatDecimalDays(double days) {
  if (!(days >= 0.0)) {
    throw std::invalid_argument("duration in days must be non-negative");
  }

  auto whole = static_cast<int64_t>(days);
  auto hours = static_cast<int64_t>(std::llround((days - static_cast<double>(whole)) * 24.0));
  if (hours == 24) {
    ++whole;
    hours = 0;
  }

  std::ostringstream out;
  out << whole << (whole == 1 ? " day " : " days ") << hours << (hours == 1 ? " hour" : " hours");
  return out.str();
}

} // namespace routebroker::util
