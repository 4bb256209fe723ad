#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace connstate::util {

/*
  Time utilities. Every timestamp the store writes comes from Now().

  Persisted timestamps are microsecond precision; Now() truncates so that a
  value written and read back compares equal.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
// Sub-microsecond digits are dropped.
TimePoint FromProto(const google::protobuf::Timestamp& ts);

// "2026-10-19T08:15:02.123456+00:00"
std::string FormatIso8601(TimePoint tp);

// RFC 3339: "Z" or a "+HH:MM" / "-HH:MM" offset; fractional seconds optional.
// Throws std::invalid_argument on malformed input.
TimePoint ParseIso8601(std::string_view text);

int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

} // namespace connstate::util
