#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace routebroker::util {

/*
  Time utilities — single place to control clock source later.

  Calendar dates are always UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Days      = std::chrono::duration<int64_t, std::ratio<86400>>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Days since the epoch of the UTC calendar date containing tp.
int64_t UtcDayNumber(TimePoint tp);

// [start, end) of the UTC calendar date containing tp.
TimePoint StartOfUtcDay(TimePoint tp);
TimePoint EndOfUtcDay(TimePoint tp);

// Parses "YYYYMMDDTHHMMSS" as UTC. Throws std::invalid_argument on mismatch.
TimePoint ParseCompactUtc(const std::string& value);

// ISO-8601 UTC rendering used in logs and the CLI.
std::string FormatUtc(TimePoint tp);

// Fractional days as "<d> days <h> hours", hours rounded.
// 1.5 -> "1 day 12 hours". Negative input throws std::invalid_argument.
std::string FormatDecimalDays(double days);

} // namespace routebroker::util
