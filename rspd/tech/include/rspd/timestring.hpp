#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "rspd/simple-charconv.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

/// Writes chars of the representation of a given time point in UTC, as used by the log sinks, and returns
/// a pointer after the last char written. The written format will be (in millisecond precision):
///   - 'YYYY-MM-DD HH:MM:SS.sss'
/// The buffer should have a space of at least 23 chars.
constexpr auto TimeToStringLog(SysTimePoint timePoint, auto out) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::milliseconds>(timePoint - daysFloor)};
  out = write4(out, static_cast<int>(ymd.year()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.month()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = '.';
  return write3(++out, hms.subseconds().count());
}

inline constexpr std::size_t kLogTimeStrLen = 23;

/// Compact form used to suffix rotated log files: 'YYYYMMDD_HHMMSS'.
/// The buffer should have a space of at least 15 chars.
constexpr auto TimeToStringCompact(SysTimePoint timePoint, auto out) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(timePoint - daysFloor)};
  out = write4(out, static_cast<int>(ymd.year()));
  out = write2(out, static_cast<unsigned>(ymd.month()));
  out = write2(out, static_cast<unsigned>(ymd.day()));
  *out = '_';
  out = write2(++out, hms.hours().count());
  out = write2(out, hms.minutes().count());
  return write2(out, hms.seconds().count());
}

inline constexpr std::size_t kCompactTimeStrLen = 15;

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Buffer must have space for at least 29 characters (no null terminator added):
/// WWW, DD Mon YYYY HH:MM:SS GMT
/// Returns pointer past last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  static constexpr const char* const WEEKDAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto day_point = floor<days>(secTp);
  const year_month_day ymd{day_point};
  const weekday wd{day_point};
  const hh_mm_ss hms{secTp - day_point};
  out = copy3(out, WEEKDAYS[wd.c_encoding()]);
  *out = ',';
  *++out = ' ';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = copy3(++out, MONTHS[static_cast<unsigned>(ymd.month()) - 1]);
  *out = ' ';
  out = write4(++out, static_cast<int>(ymd.year()));
  *out = ' ';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = ' ';
  return copy3(++out, "GMT");
}

inline constexpr std::size_t kRFC7231DateStrLen = 29;

// Convenience wrappers returning std::string.
std::string TimeToStringLog(SysTimePoint timePoint);
std::string TimeToStringRFC7231(SysTimePoint timePoint);

}  // namespace rspd
