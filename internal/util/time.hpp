#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace alarmsrv::util {

/*
  Time utilities. Clock source is controlled here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

// seconds inside 0001-01-01..9999-12-31 and nanos inside 0..999999999
bool IsValidTimestamp(const google::protobuf::Timestamp& ts);

/*
  Parses a UTC calendar time:
    YYYY-MM-DD
    YYYY-MM-DD HH
    YYYY-MM-DD HH:MM
    YYYY-MM-DD HH:MM:SS
    YYYY-MM-DD HH:MM:SS.ffffff   ('.' or ',', 1 to 9 digits)
    now, today, yesterday        (case-insensitive; days start at 00:00 UTC)
  The date/time separator may be ' ' or 'T'. Surrounding whitespace is
  ignored. Out-of-range fields fail.
*/
std::optional<TimePoint> ParseTimestamp(std::string_view text);

} // namespace alarmsrv::util
