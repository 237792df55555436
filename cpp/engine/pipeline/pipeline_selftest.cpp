/*
  Pipeline Selftest

  End-to-end runs on fixture files:
    1) happy path: CSV, MAT-file and nugget reports written, summary counts
    2) run year taken from the first top sample unless given
    3) unknown logger, malformed offsets, no data: no output file at all
    4) logger ID overrides and missing identifiers
    5) recovery-day rollover only when the data reaches the next year
    6) one blanket per run, blanket filter and config validation

  Non-zero return code indicates failure.
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/pipeline/nugget_pipeline.hpp"
#include "engine/testing/selftest_util.hpp"

#include <filesystem>
#include <string>

namespace blanket {
namespace {

using namespace selftest;
namespace fs = std::filesystem;

std::string antares(const std::string& logger_id, const std::string& rows) {
  std::string s =
      "#######################################################################\n"
      "##\n";
  if (!logger_id.empty()) s += "## LoggerIdentifier    : " + logger_id + "\n";
  s += "#######################################################################\n";
  return s + rows;
}

// 14 Feb 2011 (day 45) 12:00:00/12:00:30 and 16 Feb (day 47) 00:00:00.
const char* const kTopRows =
    "2011 02 14 12 00 00    32114    45981.044       2.100\n"
    "2011 02 14 12 00 30    32115    45980.000       2.200\n"
    "2011 02 16 00 00 00    32116    45979.000       2.300\n";

const char* const kBottomRows =
    "2011 02 14 12 00 00    33114    44981.044       2.080\n"
    "2011 02 14 12 00 30    33115    44980.000       2.180\n"
    "2011 02 16 00 00 00    33116    44979.000       2.280\n";

const char* const kDeployments =
    "Latitude(Degree),Latitude(Minutes),Longitude(Degree),Long(Dec Min),Blanket,Dive number,"
    "Deployment,Date Deployed (Julian day),Deployed Time (Hour),Deployed Time (Min),"
    "Date Recovered (Julian day),Time Recovered (Hour),Time Recovered (Min)\n"
    "-17,30.0,-113,15.0,A,3821,D1,45,6,0,46,18,0\n"
    "-17,31.5,-113,12.0,A,3822,D1,50,6,0,51,18,0\n";

// Same windows, split across two blankets.
const char* const kMixedDeployments =
    "-17,30.0,-113,15.0,A,3821,D1,45,6,0,46,18,0\n"
    "-17,31.5,-113,12.0,B,3822,D1,50,6,0,51,18,0\n";

// Fixture set in its own directory, outputs pointed into out/.
PipelineConfig make_case(const std::string& name,
                         const std::string& offsets = "0000101,0.05\n0000102,-0.03\n",
                         const std::string& top_id = "0000101",
                         const std::string& deployments = kDeployments) {
  const fs::path dir = fresh_temp_dir("pipeline_" + name);
  PipelineConfig c;
  c.top_path = write_text_file(dir / "top.dat", antares(top_id, kTopRows));
  c.bottom_path = write_text_file(dir / "bottom.dat", antares("0000102", kBottomRows));
  c.offsets_path = write_text_file(dir / "offsets.csv", offsets);
  c.deployments_path = write_text_file(dir / "deployments.csv", deployments);
  c.csv_out = (dir / "out" / "records.csv").string();
  c.mat_out = (dir / "out" / "records.mat").string();
  c.nugget_dir = (dir / "out" / "nuggets").string();
  fs::create_directories(dir / "out");
  return c;
}

bool any_output(const PipelineConfig& c) {
  return fs::exists(c.csv_out) || fs::exists(c.mat_out) || fs::exists(c.nugget_dir);
}

void test_happy_path() {
  const PipelineConfig c = make_case("ok");
  const PipelineSummary s = run_pipeline(c);

  expect_true(s.year == 2011, "year taken from the first top sample");
  expect_eq_str(s.top_logger_id, "0000101", "top logger from header");
  expect_eq_str(s.bottom_logger_id, "0000102", "bottom logger from header");
  expect_true(s.windows == 2 && s.empty_windows == 1, "one of two windows receives data");
  expect_true(s.stats.paired == 3 && s.stats.windowed == 2 && s.stats.outside_windows == 1,
              "day 47 sample falls outside the window");
  expect_true(fs::exists(c.csv_out) && fs::exists(c.mat_out), "CSV and MAT-file written");
  expect_true(s.nugget_paths.size() == 1 && fs::exists(s.nugget_paths[0]), "one nugget report");

  const std::string csv = read_text_file(c.csv_out);
  expect_true(csv.find("2011-02-14T12:00:00Z,734548.50000000,45,2.100000,2.150000,2.080000,2.050000,0.100000\n") !=
                  std::string::npos,
              "worked example row in CSV");

  run_pipeline(c);
  expect_true(read_text_file(c.csv_out) == csv, "rerun gives byte-identical CSV");
}

void test_explicit_year() {
  PipelineConfig c = make_case("year");
  c.year = 2012;  // day 45 of 2012 is 14 Feb too, but samples are in 2011
  expect_throws<NoDataError>([&] { run_pipeline(c); }, "windows placed in another year hold no data");
  expect_true(!any_output(c), "no output when nothing is windowed");
}

void test_unknown_logger_writes_nothing() {
  const PipelineConfig c = make_case("unknown", "0000101,0.05\n");
  try {
    run_pipeline(c);
    fail("logger without offset must abort the run");
  } catch (const UnknownLoggerIdError& e) {
    expect_eq_str(e.logger_id(), "0000102", "missing bottom logger named");
    expect_eq_str(e.where().path, c.bottom_path, "missing logger's file named");
  }
  expect_true(!any_output(c), "no output file after an unknown logger");
}

void test_malformed_offsets_write_nothing() {
  const PipelineConfig c = make_case("bad_offsets", "0000101,0.05\n0000102\n");
  expect_throws<MalformedRecordError>([&] { run_pipeline(c); }, "malformed offsets abort the run");
  expect_true(!any_output(c), "no output file after malformed offsets");
}

void test_overlap_writes_nothing() {
  const std::string overlapping =
      "-17,30.0,-113,15.0,A,3821,45,6,0,46,18,0\n"
      "-17,30.0,-113,15.0,A,3822,46,12,0,47,18,0\n";
  const PipelineConfig c = make_case("overlap", "0000101,0.05\n0000102,-0.03\n", "0000101", overlapping);
  expect_throws<OverlappingWindowError>([&] { run_pipeline(c); }, "overlapping windows abort the run");
  expect_true(!any_output(c), "no output file after overlapping windows");
}

void test_logger_id_override() {
  PipelineConfig c = make_case("no_id", "0000101,0.05\n0000102,-0.03\n", "");
  try {
    run_pipeline(c);
    fail("top file without LoggerIdentifier must be rejected");
  } catch (const MalformedRecordError& e) {
    expect_eq_str(e.where().field, "LoggerIdentifier", "missing identifier named");
  }
  expect_true(!any_output(c), "no output without a logger identifier");

  c.top_logger_id = std::string("0000101");
  const PipelineSummary s = run_pipeline(c);
  expect_eq_str(s.top_logger_id, "0000101", "override supplies the logger ID");
}

void test_year_rollover_follows_data() {
  const std::string rollover = "-17,30.0,-113,15.0,A,3821,D1,45,6,0,44,18,0\n";
  const PipelineConfig c = make_case("rollover", "0000101,0.05\n0000102,-0.03\n", "0000101", rollover);
  expect_throws<InvalidWindowError>([&] { run_pipeline(c); },
                                    "recovery day before deployment day with data in one year");
  expect_true(!any_output(c), "no output after an invalid window");
}

void test_blanket_filter_and_validation() {
  PipelineConfig c = make_case("filter", "0000101,0.05\n0000102,-0.03\n", "0000101", kMixedDeployments);
  try {
    run_pipeline(c);
    fail("sheet with two blankets needs a blanket filter");
  } catch (const ValidationError& e) {
    expect_true(std::string(e.what()).find("A, B") != std::string::npos, "blanket IDs listed");
  }
  expect_true(!any_output(c), "no output for a mixed-blanket sheet");

  c.blanket_id = std::string("Z");
  expect_throws<ValidationError>([&] { run_pipeline(c); }, "blanket filter with no rows rejected");

  c.blanket_id = std::string("A");
  const PipelineSummary s = run_pipeline(c);
  expect_true(s.windows == 1 && s.empty_windows == 0, "only blanket A's window used");

  PipelineConfig bad = make_case("validate");
  bad.mat_out = bad.csv_out;
  expect_throws<ValidationError>([&] { run_pipeline(bad); }, "CSV and MAT output must differ");

  bad = make_case("validate_tol");
  bad.settings.pairing.tolerance_s = 100000;
  expect_throws<ValidationError>([&] { run_pipeline(bad); }, "tolerance above one day rejected");

  bad = make_case("validate_path");
  bad.top_path.clear();
  expect_throws<ValidationError>([&] { run_pipeline(bad); }, "missing top path rejected");
}

} // namespace
} // namespace blanket

int main() {
  using namespace blanket;
  set_log_level(LogLevel::ERROR);

  test_happy_path();
  test_explicit_year();
  test_unknown_logger_writes_nothing();
  test_malformed_offsets_write_nothing();
  test_overlap_writes_nothing();
  test_logger_id_override();
  test_year_rollover_follows_data();
  test_blanket_filter_and_validation();

  return selftest::finish();
}
