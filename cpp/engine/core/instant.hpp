#pragma once
/*
================================================================================
Core: Instants + Calendar Conversions
FILE: cpp/engine/core/instant.hpp

Purpose:
  - One comparable absolute time type for every component (samples, windows,
    exports) so no module does its own day/hour/minute arithmetic.
  - Logger rows carry (year, month, day, hour, minute, second); deployment
    sheets carry (Julian day, hour, minute). Both go through the constructors
    below and nothing else.

Conventions:
  - UTC, proleptic Gregorian calendar, integer seconds since 1970-01-01.
  - Julian day = 1-based day of year (1 = Jan 1).
  - MATLAB datenum: fractional days since 0000-01-00 (datenum(1970,1,1) = 719529).
================================================================================
*/

#include <cstdint>
#include <string>

namespace blanket {

inline constexpr std::int64_t kSecondsPerDay = 86400;
inline constexpr double kDatenumUnixEpoch = 719529.0;

struct Instant {
  std::int64_t unix_seconds = 0;

  constexpr bool operator==(const Instant& o) const noexcept { return unix_seconds == o.unix_seconds; }
  constexpr bool operator!=(const Instant& o) const noexcept { return unix_seconds != o.unix_seconds; }
  constexpr bool operator<(const Instant& o) const noexcept { return unix_seconds < o.unix_seconds; }
  constexpr bool operator<=(const Instant& o) const noexcept { return unix_seconds <= o.unix_seconds; }
  constexpr bool operator>(const Instant& o) const noexcept { return unix_seconds > o.unix_seconds; }
  constexpr bool operator>=(const Instant& o) const noexcept { return unix_seconds >= o.unix_seconds; }
};

// Broken-down UTC calendar fields.
struct CalendarTime {
  int year = 1970;
  int month = 1;   // 1..12
  int day = 1;     // 1..31
  int hour = 0;    // 0..23
  int minute = 0;  // 0..59
  int second = 0;  // 0..59
};

bool is_leap_year(int year) noexcept;
int days_in_month(int year, int month) noexcept;
int days_in_year(int year) noexcept;

// Days since 1970-01-01 for a valid civil date (no range checks).
std::int64_t days_from_civil(int year, int month, int day) noexcept;

// Seconds between two instants (b - a).
inline constexpr std::int64_t seconds_between(const Instant& a, const Instant& b) noexcept {
  return b.unix_seconds - a.unix_seconds;
}

// Throws ValidationError naming the offending field on out-of-range input.
Instant instant_from_calendar(int year, int month, int day, int hour, int minute, int second);

// Throws ValidationError when julian_day is outside 1..days_in_year(year) or
// the time of day is out of range.
Instant instant_from_julian_day(int year, int julian_day, int hour, int minute, int second = 0);

CalendarTime to_calendar(const Instant& t) noexcept;

// 1-based day of year.
int julian_day_of(const Instant& t) noexcept;

double to_datenum(const Instant& t) noexcept;

// "YYYY-MM-DDTHH:MM:SSZ"
std::string format_iso8601(const Instant& t);

} // namespace blanket
