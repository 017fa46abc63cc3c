#include "time.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace zget::util {

namespace {

std::optional<TimePoint> FromTm(std::tm tm) {
  const std::time_t seconds = ::timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Clock::from_time_t(seconds);
}

} // namespace

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

std::string FormatIso8601(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           tm{};
  ::gmtime_r(&seconds, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::tm            tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }
  return FromTm(tm);
}

std::optional<TimePoint> ParseUploadDate(const std::string& yyyymmdd) {
  if (yyyymmdd.size() != 8) {
    return std::nullopt;
  }
  for (char c : yyyymmdd) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  std::tm tm{};
  tm.tm_year = std::stoi(yyyymmdd.substr(0, 4)) - 1900;
  tm.tm_mon  = std::stoi(yyyymmdd.substr(4, 2)) - 1;
  tm.tm_mday = std::stoi(yyyymmdd.substr(6, 2));
  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) {
    return std::nullopt;
  }
  return FromTm(tm);
}

} // namespace zget::util
