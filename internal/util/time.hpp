#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace zget::util {

/*
  Time utilities. All clock reads go through Now().

  Timestamps are persisted as ISO-8601 text in UTC ("2024-01-15T08:30:00").
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

std::string              FormatIso8601(TimePoint tp);
std::optional<TimePoint> ParseIso8601(const std::string& text);

// Source upload dates arrive as YYYYMMDD. Anything else yields nullopt.
std::optional<TimePoint> ParseUploadDate(const std::string& yyyymmdd);

} // namespace zget::util
