#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace recorder_common
{

using WallClock = std::chrono::system_clock;

/// epoch 기준 밀리초
inline int64_t to_epoch_ms(WallClock::time_point tp)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline WallClock::time_point from_epoch_ms(int64_t ms)
{
  return WallClock::time_point(std::chrono::milliseconds(ms));
}

/// UTC ISO 8601 밀리초 정밀도 문자열 (예: 2024-05-01T12:00:00.250Z)
inline std::string to_iso8601(WallClock::time_point tp)
{
  const int64_t ms = to_epoch_ms(tp);
  int64_t secs = ms / 1000;
  int64_t millis = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --secs;
  }
  const time_t t = static_cast<time_t>(secs);
  tm tm_utc{};
  gmtime_r(&t, &tm_utc);

  char buf[40];
  std::snprintf(
    buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
    tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
    tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, static_cast<int>(millis));
  return buf;
}

/// to_iso8601 형식(소수 초, 'Z' 생략 허용)을 파싱
inline bool parse_iso8601(const std::string & text, WallClock::time_point & out)
{
  int year = 0;
  int mon = 0;
  int day = 0;
  int hour = 0;
  int min = 0;
  int sec = 0;
  int consumed = 0;
  if (std::sscanf(
      text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
      &year, &mon, &day, &hour, &min, &sec, &consumed) != 6)
  {
    return false;
  }

  int millis = 0;
  size_t pos = static_cast<size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }

  tm tm_utc{};
  tm_utc.tm_year = year - 1900;
  tm_utc.tm_mon = mon - 1;
  tm_utc.tm_mday = day;
  tm_utc.tm_hour = hour;
  tm_utc.tm_min = min;
  tm_utc.tm_sec = sec;
  const time_t secs = timegm(&tm_utc);
  if (secs == static_cast<time_t>(-1)) {
    return false;
  }
  out = from_epoch_ms(static_cast<int64_t>(secs) * 1000 + millis);
  return true;
}

}  // namespace recorder_common
