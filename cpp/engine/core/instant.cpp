#include "engine/core/instant.hpp"

#include "engine/core/errors.hpp"

#include <cstdio>

namespace blanket {

namespace {

void require_range(int v, int lo, int hi, const char* name) {
  if (v < lo || v > hi) {
    throw ValidationError(std::string(name) + " " + std::to_string(v) + " outside [" +
                          std::to_string(lo) + ", " + std::to_string(hi) + "]");
  }
}

void require_time_of_day(int hour, int minute, int second) {
  require_range(hour, 0, 23, "hour");
  require_range(minute, 0, 59, "minute");
  require_range(second, 0, 59, "second");
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) noexcept {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

} // namespace

bool is_leap_year(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) noexcept {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap_year(year)) return 29;
  return kDays[month - 1];
}

int days_in_year(int year) noexcept {
  return is_leap_year(year) ? 366 : 365;
}

// Era-based civil <-> day count (H. Hinnant's chrono algorithms).
std::int64_t days_from_civil(int year, int month, int day) noexcept {
  const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
  const std::int64_t era = floor_div(y, 400);
  const std::int64_t yoe = y - era * 400;
  const std::int64_t mp = (month + 9) % 12;
  const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

static void civil_from_days(std::int64_t z, int* year, int* month, int* day) noexcept {
  z += 719468;
  const std::int64_t era = floor_div(z, 146097);
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  *year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
  *month = static_cast<int>(m);
  *day = static_cast<int>(d);
}

Instant instant_from_calendar(int year, int month, int day, int hour, int minute, int second) {
  require_range(year, 1, 9999, "year");
  require_range(month, 1, 12, "month");
  require_range(day, 1, days_in_month(year, month), "day");
  require_time_of_day(hour, minute, second);

  Instant t;
  t.unix_seconds = days_from_civil(year, month, day) * kSecondsPerDay +
                   static_cast<std::int64_t>(hour) * 3600 +
                   static_cast<std::int64_t>(minute) * 60 + second;
  return t;
}

Instant instant_from_julian_day(int year, int julian_day, int hour, int minute, int second) {
  require_range(year, 1, 9999, "year");
  require_range(julian_day, 1, days_in_year(year), "julian day");
  require_time_of_day(hour, minute, second);

  Instant t;
  t.unix_seconds = (days_from_civil(year, 1, 1) + julian_day - 1) * kSecondsPerDay +
                   static_cast<std::int64_t>(hour) * 3600 +
                   static_cast<std::int64_t>(minute) * 60 + second;
  return t;
}

CalendarTime to_calendar(const Instant& t) noexcept {
  const std::int64_t days = floor_div(t.unix_seconds, kSecondsPerDay);
  const std::int64_t sod = t.unix_seconds - days * kSecondsPerDay;

  CalendarTime c;
  civil_from_days(days, &c.year, &c.month, &c.day);
  c.hour = static_cast<int>(sod / 3600);
  c.minute = static_cast<int>((sod % 3600) / 60);
  c.second = static_cast<int>(sod % 60);
  return c;
}

int julian_day_of(const Instant& t) noexcept {
  const std::int64_t days = floor_div(t.unix_seconds, kSecondsPerDay);
  const CalendarTime c = to_calendar(t);
  return static_cast<int>(days - days_from_civil(c.year, 1, 1)) + 1;
}

double to_datenum(const Instant& t) noexcept {
  const std::int64_t days = floor_div(t.unix_seconds, kSecondsPerDay);
  const std::int64_t sod = t.unix_seconds - days * kSecondsPerDay;
  return kDatenumUnixEpoch + static_cast<double>(days) +
         static_cast<double>(sod) / static_cast<double>(kSecondsPerDay);
}

std::string format_iso8601(const Instant& t) {
  const CalendarTime c = to_calendar(t);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                c.year, c.month, c.day, c.hour, c.minute, c.second);
  return std::string(buf);
}

} // namespace blanket
