#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace fleetwatch::util {

/*
  Time utilities. Single place to control the clock source.

  Persisted timestamps use local wall-clock time with millisecond
  precision and the UTC offset in effect: YYYY-MM-DDTHH:MM:SS.mmm+HH:MM
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint TruncateToMillis(TimePoint tp);

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProto(std::chrono::milliseconds duration);
std::chrono::milliseconds  FromProto(const google::protobuf::Duration& duration);

uint64_t ToUnixMillis(TimePoint tp);

std::string              FormatLocal(TimePoint tp);
std::optional<TimePoint> ParseLocal(std::string_view text);

// Calendar day key (YYYYMMDD) of tp in local time.
std::string              DayKey(TimePoint tp);
std::optional<TimePoint> ParseDayKey(std::string_view key);

} // namespace fleetwatch::util
