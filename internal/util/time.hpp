#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace seawatch::util {

/*
  Time utilities. Single place to control the clock source and the
  RFC 3339 text form used by feeds and audit notes.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// nullopt when the text is not a valid RFC 3339 timestamp.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

// RFC 3339 in UTC, e.g. "2024-03-01T12:00:00Z".
std::string FormatTimestamp(TimePoint tp);

} // namespace seawatch::util
