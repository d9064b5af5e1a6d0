#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace fleetwatch::util {

namespace {

std::tm LocalTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  localtime_r(&t, &tm);
  return tm;
}

bool ParseDigits(std::string_view text, std::size_t pos, std::size_t count, int* out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    value = value * 10 + (text[i] - '0');
  }
  *out = value;
  return true;
}

std::optional<TimePoint> FromLocalFields(int year, int month, int day, int hour, int minute, int second) {
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year  = year - 1900;
  tm.tm_mon   = month - 1;
  tm.tm_mday  = day;
  tm.tm_hour  = hour;
  tm.tm_min   = minute;
  tm.tm_sec   = second;
  tm.tm_isdst = -1;

  const std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  // mktime normalizes out-of-range days (Feb 31 -> Mar 3); reject those.
  if (tm.tm_mday != day || tm.tm_mon != month - 1) return std::nullopt;
  return Clock::from_time_t(t);
}

std::optional<TimePoint> FromUtcFields(int year, int month, int day, int hour, int minute, int second) {
  const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                         std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }
  return TimePoint(std::chrono::sys_days{date}) + std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

TimePoint TruncateToMillis(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
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

google::protobuf::Duration ToProto(std::chrono::milliseconds duration) {
  google::protobuf::Duration out;
  out.set_seconds(duration.count() / 1000);
  out.set_nanos(static_cast<int32_t>((duration.count() % 1000) * 1'000'000));
  return out;
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) +
                                                               std::chrono::nanoseconds(duration.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatLocal(TimePoint tp) {
  const auto truncated = TruncateToMillis(tp);
  const auto seconds   = std::chrono::floor<std::chrono::seconds>(truncated);
  const auto millis    = std::chrono::duration_cast<std::chrono::milliseconds>(truncated - seconds).count();
  const auto tm        = LocalTm(seconds);

  const long offset      = tm.tm_gmtoff;
  const long offset_abs  = offset < 0 ? -offset : offset;
  const char offset_sign = offset < 0 ? '-' : '+';

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d%c%02ld:%02ld", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(millis), offset_sign, offset_abs / 3600, (offset_abs % 3600) / 60);
  return buf;
}

/*
  Accepts YYYY-MM-DDTHH:MM:SS with an optional fraction of any length
  (older partitions were written with microseconds) and an optional
  +HH:MM / -HH:MM offset. Fractions beyond milliseconds are dropped.
  Without an offset the text is read as local time, which is ambiguous
  in the hour repeated when daylight saving ends.
*/
std::optional<TimePoint> ParseLocal(std::string_view text) {
  int year, month, day, hour, minute, second;
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }
  if (!ParseDigits(text, 0, 4, &year) || !ParseDigits(text, 5, 2, &month) || !ParseDigits(text, 8, 2, &day) || !ParseDigits(text, 11, 2, &hour) ||
      !ParseDigits(text, 14, 2, &minute) || !ParseDigits(text, 17, 2, &second)) {
    return std::nullopt;
  }

  std::size_t pos    = 19;
  int         millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    const std::size_t digits = ++pos;
    int               scale  = 100;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
    if (pos == digits) return std::nullopt;
  }

  if (pos == text.size()) {
    auto base = FromLocalFields(year, month, day, hour, minute, second);
    if (!base) return std::nullopt;
    return *base + std::chrono::milliseconds(millis);
  }

  int offset_hours, offset_minutes;
  if (text.size() - pos != 6 || (text[pos] != '+' && text[pos] != '-') || text[pos + 3] != ':' || !ParseDigits(text, pos + 1, 2, &offset_hours) ||
      !ParseDigits(text, pos + 4, 2, &offset_minutes) || offset_hours > 23 || offset_minutes > 59) {
    return std::nullopt;
  }

  auto base = FromUtcFields(year, month, day, hour, minute, second);
  if (!base) return std::nullopt;

  const auto offset = std::chrono::hours(offset_hours) + std::chrono::minutes(offset_minutes);
  const auto utc    = text[pos] == '+' ? *base - offset : *base + offset;
  return utc + std::chrono::milliseconds(millis);
}

std::string DayKey(TimePoint tp) {
  const auto tm = LocalTm(tp);
  char       buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

std::optional<TimePoint> ParseDayKey(std::string_view key) {
  int year, month, day;
  if (key.size() != 8 || !ParseDigits(key, 0, 4, &year) || !ParseDigits(key, 4, 2, &month) || !ParseDigits(key, 6, 2, &day)) {
    return std::nullopt;
  }
  return FromLocalFields(year, month, day, 0, 0, 0);
}

} // namespace fleetwatch::util
