/*
  Exporters Selftest

  Validates:
    1) Records CSV: exact header and row text, quoting of text fields,
       no "-0.000000", empty cell for non-finite values
    2) CSV re-read matches the in-memory records within 1e-6
    3) Writing the same result twice gives byte-identical files
    4) MAT-file: 128-byte MATLAB 7.3 header, HDF5 signature after the
       512-byte user block, variable shapes, MATLAB_class tags, empty arrays
    5) Golden nugget reports: header text, one file per non-empty window,
       no file at all when two windows share a report name

  Non-zero return code indicates failure.
*/

#include "engine/align/alignment.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text.hpp"
#include "engine/exports/mat_file.hpp"
#include "engine/exports/nugget_report.hpp"
#include "engine/exports/records_csv.hpp"
#include "engine/testing/selftest_util.hpp"

#include <H5Cpp.h>

#include <cmath>
#include <filesystem>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace blanket {
namespace {

using namespace selftest;
namespace fs = std::filesystem;

Instant at(int jday, int hour, int minute, int second = 0) {
  return instant_from_julian_day(2011, jday, hour, minute, second);
}

Sample sample(const Instant& t, double temperature_c) {
  Sample s;
  s.time = t;
  s.raw_count = 32114.0;
  s.resistance_ohm = 45981.044;
  s.temperature_c = temperature_c;
  return s;
}

DeploymentWindow window(const std::string& blanket, const std::string& dive,
                        const Instant& from, const Instant& to) {
  DeploymentWindow w;
  w.blanket_id = blanket;
  w.dive_number = dive;
  w.deployment = "D1";
  w.latitude_deg_part = -17.0;
  w.latitude_min_part = 30.0;
  w.longitude_deg_part = -113.0;
  w.longitude_min_part = 15.0;
  w.latitude_deg = decimal_degrees(-17.0, 30.0);
  w.longitude_deg = decimal_degrees(-113.0, 15.0);
  w.deployed_at = from;
  w.recovered_at = to;
  return w;
}

// Two windows: dive 3821 gets three records, dive 3822 none.
AlignmentResult sample_result(const std::string& blanket = "A") {
  std::vector<Sample> top;
  std::vector<Sample> bottom;
  const double top_c[3] = {2.10, 2.1234567, 2.3};
  const double bot_c[3] = {2.08, 2.0, 2.25};
  for (int k = 0; k < 3; ++k) {
    top.push_back(sample(at(45, 12, k), top_c[k]));
    bottom.push_back(sample(at(45, 12, k), bot_c[k]));
  }

  const OffsetTable offsets({LoggerOffset{"0000101", 0.05}, LoggerOffset{"0000102", -0.03}});
  const std::vector<DeploymentWindow> windows = {
    window(blanket, "3821", at(45, 6, 0), at(46, 18, 0)),
    window(blanket, "3822", at(50, 6, 0), at(51, 18, 0)),
  };
  return align_and_correct(InstrumentStream{"0000101", "/data/top_0000101.dat", top},
                           InstrumentStream{"0000102", "/data/bot_0000102.dat", bottom},
                           offsets, windows);
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------

void test_csv_text() {
  expect_eq_str(get_records_csv_header(),
                "blanket,dive,deployment,latitude_deg,longitude_deg,timestamp_utc,datenum,julian_day,"
                "top_raw_c,top_corrected_c,bottom_raw_c,bottom_corrected_c,differential_c",
                "CSV header columns");

  const AlignmentResult r = sample_result();
  const std::string csv = format_records_csv(r);
  std::istringstream lines(csv);
  std::string header;
  std::string first;
  std::getline(lines, header);
  std::getline(lines, first);
  expect_eq_str(first,
                "A,3821,D1,-17.500000,-113.250000,2011-02-14T12:00:00Z,734548.50000000,45,"
                "2.100000,2.150000,2.080000,2.050000,0.100000",
                "first CSV row");

  std::size_t newlines = 0;
  for (char c : csv) {
    if (c == '\n') ++newlines;
  }
  expect_true(newlines == 4, "header plus one line per record");
  expect_true(csv.find('\r') == std::string::npos, "no carriage returns in CSV");

  const AlignmentResult quoted = sample_result("A,east");
  const std::string row = record_to_csv_row(quoted.groups[0], quoted.groups[0].records[0]);
  expect_true(row.rfind("\"A,east\",3821,", 0) == 0, "text field with a comma is quoted");
  expect_true(text::split_csv_row(row).size() == 13, "quoted row still splits into 13 cells");

  // Signed zero and non-finite values.
  AlignmentResult manual;
  CorrectedRecord rec;
  rec.time = at(45, 12, 0);
  rec.differential_c = -1e-9;
  rec.top.corrected_c = std::numeric_limits<double>::quiet_NaN();
  manual.groups.push_back(WindowGroup{window("A", "1", at(45, 0, 0), at(46, 0, 0)), {rec}});
  manual.stats.windowed = 1;
  const auto cells = text::split_csv_row(record_to_csv_row(manual.groups[0], rec));
  expect_eq_str(cells.at(12), "0.000000", "tiny negative differential prints without sign");
  expect_eq_str(cells.at(9), "", "NaN prints as an empty cell");

  CsvExportOptions no_header;
  no_header.include_header = false;
  expect_true(format_records_csv(r, no_header).rfind("A,3821,", 0) == 0, "header can be omitted");
}

void test_csv_round_trip(const fs::path& dir) {
  const AlignmentResult r = sample_result();
  const std::string path = (dir / "records.csv").string();
  write_records_csv_file(r, path);

  std::istringstream in(read_text_file(path));
  std::string line;
  std::getline(in, line);  // header

  std::size_t n = 0;
  bool all_close = true;
  for (const auto& g : r.groups) {
    for (const auto& rec : g.records) {
      if (!std::getline(in, line)) {
        all_close = false;
        break;
      }
      const auto cells = text::split_csv_row(line);
      const double expected[5] = {rec.top.temperature_c, rec.top.corrected_c,
                                  rec.bottom.temperature_c, rec.bottom.corrected_c, rec.differential_c};
      for (int k = 0; k < 5; ++k) {
        double v = 0.0;
        if (!text::try_parse_double(cells.at(8 + k), v) || std::fabs(v - expected[k]) > 1e-6) {
          all_close = false;
        }
      }
      double dn = 0.0;
      if (!text::try_parse_double(cells.at(6), dn) || std::fabs(dn - to_datenum(rec.time)) > 1e-6) {
        all_close = false;
      }
      ++n;
    }
  }
  expect_true(all_close && n == r.record_count(), "CSV values re-read within 1e-6");
  expect_true(!std::getline(in, line), "no trailing rows");
}

void test_csv_deterministic(const fs::path& dir) {
  const std::string a = (dir / "run1.csv").string();
  const std::string b = (dir / "run2.csv").string();
  write_records_csv_file(sample_result(), a);
  write_records_csv_file(sample_result(), b);
  write_records_csv_file(sample_result(), b);  // overwrite
  expect_true(read_text_file(a) == read_text_file(b), "identical inputs give byte-identical CSV");

  expect_throws<IOError>([&] { write_records_csv_file(sample_result(), (dir / "no/such/dir.csv").string()); },
                         "unwritable CSV path is an IOError");
}

// ---------------------------------------------------------------------------
// MAT-file
// ---------------------------------------------------------------------------

std::vector<double> read_column(H5::H5File& f, const std::string& name, hsize_t* rows, hsize_t* cols) {
  H5::DataSet ds = f.openDataSet(name);
  H5::DataSpace sp = ds.getSpace();
  hsize_t dims[2] = {0, 0};
  sp.getSimpleExtentDims(dims);
  *rows = dims[0];
  *cols = dims[1];
  std::vector<double> v(static_cast<std::size_t>(dims[0] * dims[1]));
  ds.read(v.data(), H5::PredType::NATIVE_DOUBLE);
  return v;
}

std::string read_class(H5::H5File& f, const std::string& name) {
  H5::DataSet ds = f.openDataSet(name);
  H5::Attribute a = ds.openAttribute("MATLAB_class");
  std::string cls;
  a.read(a.getStrType(), cls);
  return cls;
}

void test_mat_header() {
  const std::string h = mat73_header();
  expect_true(h.size() == kMatHeaderBytes, "MAT header is 128 bytes");
  expect_true(h.rfind("MATLAB 7.3 MAT-file", 0) == 0, "MAT header text");
  expect_true(h[124] == '\x00' && h[125] == '\x02' && h[126] == 'I' && h[127] == 'M',
              "MAT header version and endian marker");
}

void test_mat_file(const fs::path& dir) {
  const AlignmentResult r = sample_result();
  const std::string path = (dir / "records.mat").string();
  write_alignment_mat_file(r, path);

  const std::string bytes = read_text_file(path);
  expect_true(bytes.size() > kMatUserblockBytes, "MAT-file larger than its user block");
  expect_true(bytes.compare(0, kMatHeaderBytes, mat73_header()) == 0, "MAT header stamped at offset 0");
  expect_true(bytes.compare(kMatUserblockBytes, 8, std::string("\x89HDF\r\n\x1a\n", 8)) == 0,
              "HDF5 signature after the user block");

  try {
    H5::Exception::dontPrint();
    H5::H5File f(path, H5F_ACC_RDONLY);

    hsize_t rows = 0;
    hsize_t cols = 0;
    const auto top = read_column(f, "Top", &rows, &cols);
    expect_true(rows == 1 && cols == 3, "Top stored as MATLAB 3x1");
    expect_near(top.at(0), 2.15, 1e-12, "Top holds corrected values");

    const auto diff = read_column(f, "Diff", &rows, &cols);
    expect_near(diff.at(0), 0.10, 1e-9, "Diff holds differentials");

    const auto when = read_column(f, "DateTime", &rows, &cols);
    expect_near(when.at(0), 734548.5, 1e-9, "DateTime holds datenums");

    const auto win = read_column(f, "Window", &rows, &cols);
    expect_true(win.size() == 3 && win[0] == 1.0 && win[2] == 1.0, "Window index is 1-based");

    const auto dep = read_column(f, "deptimev", &rows, &cols);
    expect_true(rows == 1 && cols == 2, "one deployment time per window");

    const auto lat = read_column(f, "Latitude", &rows, &cols);
    expect_near(lat.at(1), -17.5, 1e-12, "Latitude per window");

    const auto off = read_column(f, "TopOffset", &rows, &cols);
    expect_true(rows == 1 && cols == 1, "TopOffset is a scalar");
    expect_near(off.at(0), 0.05, 0.0, "TopOffset value");

    expect_eq_str(read_class(f, "Bot"), "double", "MATLAB_class tag");
    f.close();
  } catch (const H5::Exception& e) {
    fail("reading MAT-file back: " + e.getDetailMsg());
  }
}

void test_mat_empty_and_names(const fs::path& dir) {
  MatFileWriter w;
  w.add_column("Empty", {});
  w.add_scalar("One", 1.0);
  expect_throws<ValidationError>([&] { w.add_scalar("One", 2.0); }, "repeated variable rejected");
  expect_throws<ValidationError>([&] { w.add_scalar("1abc", 2.0); }, "variable must start with a letter");
  expect_throws<ValidationError>([&] { w.add_scalar("a-b", 2.0); }, "variable with '-' rejected");
  expect_true(w.variable_count() == 2, "rejected variables not added");

  const std::string path = (dir / "empty.mat").string();
  w.write(path);
  try {
    H5::H5File f(path, H5F_ACC_RDONLY);
    H5::DataSet ds = f.openDataSet("Empty");
    expect_true(ds.attrExists("MATLAB_empty"), "empty array carries MATLAB_empty");
    expect_eq_str(read_class(f, "Empty"), "double", "empty array still tagged double");
    f.close();
  } catch (const H5::Exception& e) {
    fail("reading empty MAT-file back: " + e.getDetailMsg());
  }

  expect_throws<IOError>([&] { w.write((dir / "no/such/dir.mat").string()); },
                         "unwritable MAT path is an IOError");
}

// ---------------------------------------------------------------------------
// Golden nuggets
// ---------------------------------------------------------------------------

void test_nuggets(const fs::path& dir) {
  const AlignmentResult r = sample_result();
  const NuggetSources src{"/data/top_0000101.dat", "/data/bot_0000102.dat"};

  expect_eq_str(format_nugget_time(at(45, 12, 0, 7)), "14-Feb-2011 12:00:07", "nugget time format");

  DeploymentWindow odd = r.groups[0].window;
  odd.dive_number = "38/21";
  expect_eq_str(nugget_file_name(odd), "38_21_A_D1.dat", "unsafe file name characters replaced");

  const std::string text = format_nugget_report(r, r.groups[0], src);
  expect_true(text.find(" Blanket Letter             : A\n") != std::string::npos, "blanket in header");
  expect_true(text.find(" Top Thermistor ID          : 0000101\n") != std::string::npos, "top ID in header");
  expect_true(text.find(" Bottom Thermistor Filename : bot_0000102.dat\n") != std::string::npos,
              "bottom file name without directory");
  expect_true(text.find(" Top Thermistor Offset      : 0.0500 [deg C]\n") != std::string::npos,
              "top offset in header");
  expect_true(text.find(" Date/Time Deployed  : 14-Feb-2011 06:00:00\n") != std::string::npos,
              "deployment time in header");
  expect_true(text.find("14-Feb-2011 12:00:00") != std::string::npos, "first record in table");

  std::size_t lines = 0;
  for (char c : text) {
    if (c == '\n') ++lines;
  }
  expect_true(lines == 25 + 3, "25 header lines plus one per record");

  const auto out_dir = dir / "nuggets";
  const auto written = write_nugget_reports(r, out_dir.string(), src);
  expect_true(written.size() == 1, "empty window writes no report");
  expect_true(fs::exists(out_dir / "3821_A_D1.dat"), "report named after the window");
  expect_true(!fs::exists(out_dir / "3822_A_D1.dat"), "no report for the empty window");
}

void test_nugget_name_clash(const fs::path& dir) {
  AlignmentResult r = sample_result();
  const NuggetSources src{"/data/top_0000101.dat", "/data/bot_0000102.dat"};

  // "38/21" and "38_21" both sanitize to 38_21_A_D1.dat.
  r.groups[0].window.dive_number = "38/21";
  r.groups[0].window.source_row = 2;
  r.groups[1] = r.groups[0];
  r.groups[1].window.dive_number = "38_21";
  r.groups[1].window.source_row = 3;

  const auto out_dir = dir / "nuggets_clash";
  try {
    write_nugget_reports(r, out_dir.string(), src);
    fail("two windows with one report name must be rejected");
  } catch (const IOError& e) {
    const std::string msg = e.what();
    expect_true(msg.find("38_21_A_D1.dat") != std::string::npos, "clashing name reported");
    expect_true(msg.find("rows 2 and 3") != std::string::npos, "both deployment rows reported");
  }
  expect_true(!fs::exists(out_dir / "38_21_A_D1.dat"), "no report written on a name clash");

  r.groups[1].records.clear();
  check_nugget_file_names(r);
  pass("empty window does not claim a report name");
}

} // namespace
} // namespace blanket

int main() {
  using namespace blanket;
  set_log_level(LogLevel::WARN);

  const auto dir = selftest::fresh_temp_dir("exports");
  test_csv_text();
  test_csv_round_trip(dir);
  test_csv_deterministic(dir);
  test_mat_header();
  test_mat_file(dir);
  test_mat_empty_and_names(dir);
  test_nuggets(dir);
  test_nugget_name_clash(dir);

  return selftest::finish();
}
