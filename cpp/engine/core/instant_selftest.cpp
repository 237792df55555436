/*
  Instant / Calendar Selftest

  Checks the only two timestamp constructors (calendar fields, Julian day)
  agree with each other and with the derived views (calendar, day of year,
  datenum, ISO-8601), and that out-of-range input is rejected.

  Non-zero return code indicates failure.
*/

#include "engine/core/errors.hpp"
#include "engine/core/instant.hpp"
#include "engine/testing/selftest_util.hpp"

#include <string>

namespace blanket {
namespace {

using namespace selftest;

void test_calendar_basics() {
  expect_true(is_leap_year(2000), "2000 is a leap year");
  expect_true(!is_leap_year(1900), "1900 is not a leap year");
  expect_true(is_leap_year(2012), "2012 is a leap year");
  expect_true(days_in_month(2011, 2) == 28, "Feb 2011 has 28 days");
  expect_true(days_in_month(2012, 2) == 29, "Feb 2012 has 29 days");
  expect_true(days_in_year(2012) == 366, "2012 has 366 days");

  expect_true(instant_from_calendar(1970, 1, 1, 0, 0, 0).unix_seconds == 0, "Unix epoch is zero");
  expect_true(days_from_civil(2011, 1, 1) == 14975, "2011-01-01 is day 14975");
}

void test_julian_day_matches_calendar() {
  const Instant a = instant_from_julian_day(2011, 45, 12, 0);
  const Instant b = instant_from_calendar(2011, 2, 14, 12, 0, 0);
  expect_true(a == b, "Julian day 45 of 2011 is 14 Feb");
  expect_true(julian_day_of(a) == 45, "julian_day_of inverts instant_from_julian_day");

  const Instant dec31 = instant_from_julian_day(2012, 366, 23, 59, 59);
  const CalendarTime c = to_calendar(dec31);
  expect_true(c.year == 2012 && c.month == 12 && c.day == 31, "day 366 of a leap year is 31 Dec");
  expect_true(c.hour == 23 && c.minute == 59 && c.second == 59, "time of day preserved");

  const Instant jan1 = instant_from_julian_day(2011, 1, 0, 0);
  expect_true(julian_day_of(jan1) == 1, "Julian days are 1-based");
}

void test_views() {
  const Instant t = instant_from_calendar(2011, 2, 14, 12, 0, 0);
  expect_eq_str(format_iso8601(t), "2011-02-14T12:00:00Z", "ISO-8601 formatting");
  expect_near(to_datenum(t), 734548.5, 1e-9, "MATLAB datenum of 2011-02-14 12:00");
  expect_near(to_datenum(Instant{0}), 719529.0, 0.0, "datenum of the Unix epoch");

  const Instant before_epoch{-1};
  const CalendarTime c = to_calendar(before_epoch);
  expect_true(c.year == 1969 && c.month == 12 && c.day == 31 && c.hour == 23 && c.second == 59,
              "negative instants map to the previous day");

  const Instant later = instant_from_calendar(2011, 2, 14, 12, 0, 30);
  expect_true(seconds_between(t, later) == 30, "seconds_between is b - a");
  expect_true(t < later && later > t && t != later, "instants are totally ordered");
}

void test_rejects_out_of_range() {
  expect_throws<ValidationError>([] { instant_from_calendar(2011, 2, 29, 0, 0, 0); },
                                 "29 Feb in a non-leap year rejected");
  expect_throws<ValidationError>([] { instant_from_calendar(2011, 13, 1, 0, 0, 0); },
                                 "month 13 rejected");
  expect_throws<ValidationError>([] { instant_from_calendar(2011, 1, 1, 24, 0, 0); },
                                 "hour 24 rejected");
  expect_throws<ValidationError>([] { instant_from_julian_day(2011, 366, 0, 0); },
                                 "day 366 of a non-leap year rejected");
  expect_throws<ValidationError>([] { instant_from_julian_day(2011, 0, 0, 0); },
                                 "Julian day 0 rejected");
  expect_throws<ValidationError>([] { instant_from_julian_day(2011, 10, 0, 60); },
                                 "minute 60 rejected");
}

} // namespace
} // namespace blanket

int main() {
  using namespace blanket;

  test_calendar_basics();
  test_julian_day_matches_calendar();
  test_views();
  test_rejects_out_of_range();

  return selftest::finish();
}
