/*
  Input Readers Selftest

  Covers the three input files:
    1) ANTARES logger export: header fields, lazy/restartable rows, comment
       and blank lines, whole-file rejection on a malformed row
    2) Offset table: ID normalization, repeated rows, conflicting duplicates
    3) Deployment sheet: 12/13 columns, header row vs. bad first data row,
       decimal degrees, range checks, blanket IDs, year rollover bounded by
       the data, recovery-before-deployment

  Fixtures are written to a fresh temporary directory.
  Non-zero return code indicates failure.
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/io/antares_dat.hpp"
#include "engine/io/deployment_table.hpp"
#include "engine/io/offset_table.hpp"
#include "engine/testing/selftest_util.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace blanket {
namespace {

using namespace selftest;
namespace fs = std::filesystem;

const char* const kAntaresHeader =
    "#######################################################################\n"
    "##\n"
    "## LoggerIdentifier    : 0000101A\n"
    "## TotalSampleCount    :         3\n"
    "#######################################################################\n";

const char* const kDeploymentHeader =
    "Latitude(Degree),Latitude(Minutes),Longitude(Degree),Long(Dec Min),Blanket,Dive number,"
    "Deployment,Date Deployed (Julian day),Deployed Time (Hour),Deployed Time (Min),"
    "Date Recovered (Julian day),Time Recovered (Hour),Time Recovered (Min)\n";

// ---------------------------------------------------------------------------
// ANTARES
// ---------------------------------------------------------------------------

void test_antares_reads_header_and_rows(const fs::path& dir) {
  const std::string path = write_text_file(dir / "top.dat",
      std::string(kAntaresHeader) +
      "2011 02 14 12 00 00    32114    45981.044       2.100\n"
      "2011 02 14 12 00 30    32115    45980.000       2.200\n"
      "\n"
      "# operator note\n"
      "2011 02 14 12 01 00    32116    45979.000       2.300\n");

  SampleStream stream(path);
  expect_eq_str(stream.header().logger_id, "0000101A", "LoggerIdentifier read from header");
  expect_true(stream.header().declared_sample_count.has_value() &&
                  *stream.header().declared_sample_count == 3,
              "TotalSampleCount read from header");
  expect_true(stream.header().header_lines == 5, "header spans five lines");

  Sample s;
  expect_true(stream.next(&s), "first row parsed");
  expect_true(s.time == instant_from_calendar(2011, 2, 14, 12, 0, 0), "first row timestamp");
  expect_near(s.raw_count, 32114.0, 0.0, "raw count column");
  expect_near(s.resistance_ohm, 45981.044, 1e-9, "resistance column");
  expect_near(s.temperature_c, 2.1, 1e-12, "temperature column");
  expect_true(stream.next(&s), "second row parsed");

  stream.restart();
  expect_true(stream.next(&s) && s.raw_count == 32114.0, "restart rewinds to the first data row");

  stream.restart();
  const std::vector<Sample> all = read_all_samples(stream);
  expect_true(all.size() == 3, "blank and comment lines skipped");
  expect_near(all.back().temperature_c, 2.3, 1e-12, "last row read");
  expect_true(!stream.next(&s), "stream exhausted after draining");
}

void test_antares_count_mismatch_is_not_fatal(const fs::path& dir) {
  const std::string path = write_text_file(dir / "short.dat",
      std::string(kAntaresHeader) +
      "2011 02 14 12 00 00    32114    45981.044       2.100\n");
  AntaresHeader h;
  const auto samples = read_antares_file(path, &h);
  expect_true(samples.size() == 1, "declared count mismatch only warns");
  expect_eq_str(h.logger_id, "0000101A", "header returned to caller");
}

void test_antares_rejects_malformed(const fs::path& dir) {
  const std::string short_row = write_text_file(dir / "bad_cols.dat",
      std::string(kAntaresHeader) +
      "2011 02 14 12 00 00    32114    45981.044       2.100\n"
      "2011 02 14 12 00 30    32115    45980.000\n");
  try {
    read_antares_file(short_row);
    fail("eight-column row must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_true(e.where().row == 7, "malformed row reports its line number");
    expect_eq_str(e.where().path, short_row, "malformed row reports the file");
  }

  const std::string bad_number = write_text_file(dir / "bad_num.dat",
      std::string(kAntaresHeader) +
      "2011 02 14 12 00 00    32114    45981.044       n/a\n");
  try {
    read_antares_file(bad_number);
    fail("non-numeric temperature must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_eq_str(e.where().field, "temperature_c", "non-numeric field named");
  }

  const std::string bad_date = write_text_file(dir / "bad_date.dat",
      std::string(kAntaresHeader) +
      "2011 02 30 12 00 00    32114    45981.044       2.100\n");
  try {
    read_antares_file(bad_date);
    fail("30 Feb must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_eq_str(e.where().field, "timestamp", "invalid calendar date reported as timestamp");
  }

  const std::string not_antares = write_text_file(dir / "plain.dat",
      "2011 02 14 12 00 00    32114    45981.044       2.100\n");
  expect_throws<MalformedRecordError>([&] { SampleStream s(not_antares); },
                                      "file without '##' banner rejected");

  expect_throws<IOError>([&] { SampleStream s((dir / "missing.dat").string()); },
                         "missing logger file is an IOError");
}

// ---------------------------------------------------------------------------
// Offsets
// ---------------------------------------------------------------------------

void test_offsets(const fs::path& dir) {
  const std::string path = write_text_file(dir / "offsets.csv",
      "0000101,0.05\n"
      "0000102,-0.03\n"
      "\n"
      "0000101,0.05\n");
  const OffsetTable t = OffsetTable::load(path);
  expect_true(t.size() == 2, "repeated identical row collapses");
  expect_true(t.find("0000101").has_value() && *t.find("0000101") == 0.05, "offset looked up");
  expect_true(t.find(" 0000102B ").has_value() && *t.find(" 0000102B ") == -0.03,
              "lookup trims and truncates logger IDs");
  expect_true(!t.contains("0000999"), "absent logger not found");

  try {
    t.require("0000999", RecordContext{"top.dat", 0, "LoggerIdentifier"});
    fail("require() must throw for an absent logger");
  } catch (const UnknownLoggerIdError& e) {
    expect_eq_str(e.logger_id(), "0000999", "unknown logger ID carried by the error");
    expect_eq_str(e.where().path, "top.dat", "unknown logger context carried by the error");
  }

  const std::string conflict = write_text_file(dir / "conflict.csv",
      "0000101,0.05\n"
      "0000101,0.06\n");
  try {
    OffsetTable::load(conflict);
    fail("conflicting duplicate must be rejected");
  } catch (const DuplicateLoggerIdError& e) {
    expect_true(e.where().row == 2, "duplicate reported on its second row");
  }

  const std::string three_cols = write_text_file(dir / "three.csv", "0000101,0.05,x\n");
  expect_throws<MalformedRecordError>([&] { OffsetTable::load(three_cols); },
                                      "three-column offset row rejected");

  const std::string not_number = write_text_file(dir / "nan.csv", "0000101,warm\n");
  try {
    OffsetTable::load(not_number);
    fail("non-numeric offset must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_eq_str(e.where().field, "offset", "non-numeric offset field named");
  }

  ParseSettings wide;
  wide.logger_id_width = 0;
  const OffsetTable full({LoggerOffset{"0000101A", 0.1}}, wide.logger_id_width);
  expect_true(!full.contains("0000101"), "width 0 keeps the whole ID");
}

// ---------------------------------------------------------------------------
// Deployments
// ---------------------------------------------------------------------------

void test_deployments_load(const fs::path& dir) {
  const std::string path = write_text_file(dir / "deploy13.csv",
      std::string(kDeploymentHeader) +
      "-17,30.0,-113,15.0,A,3821,D1,45,6,0,46,18,0\n"
      "-17,31.5,-113,12.0,B,3822,D2,47.0,0,0,48,12,30\n");

  const DeploymentTable table = DeploymentTable::load(path);
  expect_true(table.size() == 2, "header row skipped");
  expect_true(table.rows()[0].row == 2, "rows keep their line numbers");

  const auto windows = table.resolve(2011);
  expect_true(windows.size() == 2, "one window per row");
  const DeploymentWindow& w = windows[0];
  expect_near(w.latitude_deg, -17.5, 1e-12, "southern latitude: minutes follow the degree sign");
  expect_near(w.longitude_deg, -113.25, 1e-12, "western longitude: minutes follow the degree sign");
  expect_eq_str(w.label(), "3821_A_D1", "label joins dive, blanket, deployment");
  expect_true(w.deployed_at == instant_from_julian_day(2011, 45, 6, 0), "deployment instant");
  expect_true(w.recovered_at == instant_from_julian_day(2011, 46, 18, 0), "recovery instant");
  expect_true(windows[1].deployed_at == instant_from_julian_day(2011, 47, 0, 0),
              "spreadsheet integer '47.0' accepted");

  const DeploymentTable only_b = table.filter_blanket("B");
  expect_true(only_b.size() == 1 && only_b.rows()[0].dive_number == "3822", "blanket filter");

  const std::string twelve = write_text_file(dir / "deploy12.csv",
      "10,6.0,20,30.0,A,1,45,6,0,46,18,0\n"
      "-0,30.0,0,0.0,A,2,50,6,0,51,18,0\n");
  const auto w12 = DeploymentTable::load(twelve).resolve(2011);
  expect_true(w12.size() == 2 && w12[0].deployment.empty(), "12-column sheet has no label");
  expect_near(w12[0].latitude_deg, 10.1, 1e-12, "northern latitude");
  expect_near(w12[1].latitude_deg, -0.5, 1e-12, "negative zero degrees keeps the sign");
  expect_eq_str(w12[0].label(), "1_A", "label without deployment");
}

void test_deployments_reject(const fs::path& dir) {
  const std::string bad_minutes = write_text_file(dir / "bad_min.csv",
      "-17,60.0,-113,15.0,A,3821,45,6,0,46,18,0\n");
  try {
    DeploymentTable::load(bad_minutes);
    fail("60 minutes of latitude must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_eq_str(e.where().field, "Latitude(Minutes)", "minutes column named");
    expect_true(e.where().row == 1, "row number reported");
  }

  const std::string bad_hour = write_text_file(dir / "bad_hour.csv",
      "-17,30.0,-113,15.0,A,3821,45,24,0,46,18,0\n");
  try {
    DeploymentTable::load(bad_hour);
    fail("hour 24 must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_eq_str(e.where().field, "Deployed Time (Hour)", "hour column named");
  }

  const std::string short_row = write_text_file(dir / "short.csv",
      "-17,30.0,-113,15.0,A,3821,45,6,0,46,18\n");
  expect_throws<MalformedRecordError>([&] { DeploymentTable::load(short_row); },
                                      "eleven-column row rejected");

  const std::string missing_blanket = write_text_file(dir / "no_blanket.csv",
      "-17,30.0,-113,15.0,,3821,45,6,0,46,18,0\n");
  expect_throws<MalformedRecordError>([&] { DeploymentTable::load(missing_blanket); },
                                      "empty blanket cell rejected");

  const std::string backwards = write_text_file(dir / "backwards.csv",
      "-17,30.0,-113,15.0,A,3821,45,12,0,45,6,0\n");
  const DeploymentTable bt = DeploymentTable::load(backwards);
  try {
    bt.resolve(2011);
    fail("recovery before deployment must be rejected");
  } catch (const InvalidWindowError& e) {
    expect_true(e.where().row == 1, "invalid window names its row");
  }

  const std::string day366 = write_text_file(dir / "day366.csv",
      "-17,30.0,-113,15.0,A,3821,366,0,0,366,6,0\n");
  const DeploymentTable d366 = DeploymentTable::load(day366);
  expect_throws<MalformedRecordError>([&] { d366.resolve(2011); },
                                      "day 366 rejected in a non-leap year");
  expect_true(d366.resolve(2012).size() == 1, "day 366 accepted in a leap year");

  expect_throws<IOError>([&] { DeploymentTable::load((dir / "missing.csv").string()); },
                         "missing deployment sheet is an IOError");
}

void test_deployments_first_row_is_data(const fs::path& dir) {
  const std::string empty_lat = write_text_file(dir / "empty_lat.csv",
      ",30.0,-113,15.0,A,3821,45,6,0,46,18,0\n"
      "-17,30.0,-113,15.0,A,3822,47,6,0,48,18,0\n");
  try {
    DeploymentTable::load(empty_lat);
    fail("first data row with an empty latitude must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_true(e.where().row == 1, "bad first row reported as row 1");
    expect_eq_str(e.where().field, "Latitude(Degree)", "latitude column named");
  }

  const std::string text_lat = write_text_file(dir / "text_lat.csv",
      "south,30.0,-113,15.0,A,3821,45,6,0,46,18,0\n");
  expect_throws<MalformedRecordError>([&] { DeploymentTable::load(text_lat); },
                                      "first row with numeric cells is data, not a header");

  const std::string header_only = write_text_file(dir / "header_only.csv", kDeploymentHeader);
  expect_true(DeploymentTable::load(header_only).empty(), "all-text first row is a header");
}

void test_deployments_blanket_ids(const fs::path& dir) {
  const std::string path = write_text_file(dir / "blankets.csv",
      "-17,30.0,-113,15.0,B,3821,45,6,0,46,18,0\n"
      "-17,30.0,-113,15.0,A,3822,47,6,0,48,18,0\n"
      "-17,30.0,-113,15.0,B,3823,49,6,0,50,18,0\n");
  const auto ids = DeploymentTable::load(path).blanket_ids();
  expect_true(ids.size() == 2 && ids[0] == "A" && ids[1] == "B", "distinct blanket IDs, sorted");
}

void test_deployments_year_rollover(const fs::path& dir) {
  const std::string path = write_text_file(dir / "rollover.csv",
      "-17,30.0,-113,15.0,A,3821,365,6,0,2,18,0\n");
  const DeploymentTable table = DeploymentTable::load(path);
  const auto windows = table.resolve(2011, 2012);
  expect_true(windows.size() == 1, "rollover row resolved");
  const CalendarTime rec = to_calendar(windows[0].recovered_at);
  expect_true(rec.year == 2012 && rec.month == 1 && rec.day == 2, "recovery rolls into the next year");
  expect_true(windows[0].deployed_at < windows[0].recovered_at, "rolled window is valid");

  expect_throws<InvalidWindowError>([&] { table.resolve(2011); },
                                    "no rollover when the data stays in one year");
  expect_throws<InvalidWindowError>([&] { table.resolve(2011, 2011); },
                                    "no rollover when the last sample is in the deployment year");

  const std::string typo = write_text_file(dir / "typo_day.csv",
      "-17,30.0,-113,15.0,A,3821,45,6,0,44,18,0\n");
  try {
    DeploymentTable::load(typo).resolve(2011, 2011);
    fail("recovery day before deployment day within one year must be rejected");
  } catch (const InvalidWindowError& e) {
    expect_true(e.where().row == 1, "invalid window names its row");
  }
}

} // namespace
} // namespace blanket

int main() {
  using namespace blanket;
  set_log_level(LogLevel::WARN);

  const auto dir = selftest::fresh_temp_dir("io");
  test_antares_reads_header_and_rows(dir);
  test_antares_count_mismatch_is_not_fatal(dir);
  test_antares_rejects_malformed(dir);
  test_offsets(dir);
  test_deployments_load(dir);
  test_deployments_reject(dir);
  test_deployments_first_row_is_data(dir);
  test_deployments_blanket_ids(dir);
  test_deployments_year_rollover(dir);

  return selftest::finish();
}
