#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace connstate::util {

using google::protobuf::util::TimeUtil;

TimePoint Now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto sec    = std::chrono::floor<std::chrono::seconds>(tp);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(micros.count() * 1000));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::seconds(ts.seconds()) +
         std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::nanoseconds(ts.nanos()));
}

std::string FormatIso8601(TimePoint tp) {
  auto ts          = ToProto(tp);
  const auto nanos = ts.nanos();
  ts.set_nanos(0);

  // TimeUtil trims the fraction to 0/3/6/9 digits; the stored form always
  // carries six so text order matches time order.
  std::string whole = TimeUtil::ToString(ts); // "YYYY-MM-DDTHH:MM:SSZ"
  whole.pop_back();

  std::ostringstream out;
  out << whole << '.' << std::setw(6) << std::setfill('0') << nanos / 1000 << "+00:00";
  return out.str();
}

TimePoint ParseIso8601(std::string_view text) {
  google::protobuf::Timestamp ts;
  if (!TimeUtil::FromString(std::string(text), &ts)) {
    throw std::invalid_argument("malformed timestamp: '" + std::string(text) + "'");
  }
  return FromProto(ts);
}

int64_t ToUnixMicros(TimePoint tp) {
  return tp.time_since_epoch().count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{std::chrono::microseconds(micros)};
}

} // namespace connstate::util
