#include "engine/io/deployment_table.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace blanket {

namespace {

enum Column : std::size_t {
  kLatDeg = 0,
  kLatMin,
  kLonDeg,
  kLonMin,
  kBlanket,
  kDive,
  kDeployment,
  kDepDay,
  kDepHour,
  kDepMin,
  kRecDay,
  kRecHour,
  kRecMin,
  kColumnCount,
};

const char* const kColumnNames[kColumnCount] = {
  "Latitude(Degree)",
  "Latitude(Minutes)",
  "Longitude(Degree)",
  "Long(Dec Min)",
  "Blanket",
  "Dive number",
  "Deployment",
  "Date Deployed (Julian day)",
  "Deployed Time (Hour)",
  "Deployed Time (Min)",
  "Date Recovered (Julian day)",
  "Time Recovered (Hour)",
  "Time Recovered (Min)",
};

// Maps a logical column to its cell index; 12-column sheets have no label.
class CellReader {
 public:
  CellReader(const std::vector<std::string>& cells, const std::string& path, std::size_t row)
      : cells_(cells), path_(path), row_(row), has_label_(cells.size() == kColumnCount) {}

  bool has(Column c) const noexcept { return c != kDeployment || has_label_; }

  std::string str(Column c) const {
    if (!has(c)) return std::string();
    return text::trim(cells_[index(c)]);
  }

  std::string required_str(Column c) const {
    std::string s = str(c);
    if (s.empty()) fail(c, "missing value");
    return s;
  }

  double number(Column c) const {
    double v = 0.0;
    if (!text::try_parse_double(cells_[index(c)], v)) {
      fail(c, "not a number: '" + text::trim(cells_[index(c)]) + "'");
    }
    return v;
  }

  int integer(Column c, int lo, int hi) const {
    int v = 0;
    if (!text::try_parse_int(cells_[index(c)], v)) {
      // Sheets exported from spreadsheets sometimes carry "45.0".
      double d = 0.0;
      if (!text::try_parse_double(cells_[index(c)], d) || d != std::floor(d) || std::fabs(d) > 1e9) {
        fail(c, "not an integer: '" + text::trim(cells_[index(c)]) + "'");
      }
      v = static_cast<int>(d);
    }
    if (v < lo || v > hi) {
      std::ostringstream oss;
      oss << "value " << v << " outside [" << lo << ", " << hi << "]";
      fail(c, oss.str());
    }
    return v;
  }

  [[noreturn]] void fail(Column c, const std::string& msg) const {
    throw MalformedRecordError(msg, RecordContext{path_, row_, kColumnNames[c]});
  }

 private:
  std::size_t index(Column c) const noexcept {
    if (has_label_ || c < kDeployment) return static_cast<std::size_t>(c);
    return static_cast<std::size_t>(c) - 1;
  }

  const std::vector<std::string>& cells_;
  const std::string& path_;
  std::size_t row_;
  bool has_label_;
};

DeploymentRow parse_row(const std::vector<std::string>& cells, const std::string& path, std::size_t row) {
  CellReader r(cells, path, row);

  DeploymentRow d;
  d.row = row;
  d.latitude_deg_part = r.number(kLatDeg);
  d.latitude_min_part = r.number(kLatMin);
  d.longitude_deg_part = r.number(kLonDeg);
  d.longitude_min_part = r.number(kLonMin);

  if (std::fabs(d.latitude_deg_part) > 90.0) r.fail(kLatDeg, "latitude outside [-90, 90]");
  if (std::fabs(d.longitude_deg_part) > 180.0) r.fail(kLonDeg, "longitude outside [-180, 180]");
  if (d.latitude_min_part < 0.0 || d.latitude_min_part >= 60.0) r.fail(kLatMin, "minutes outside [0, 60)");
  if (d.longitude_min_part < 0.0 || d.longitude_min_part >= 60.0) r.fail(kLonMin, "minutes outside [0, 60)");

  d.blanket_id = r.required_str(kBlanket);
  d.dive_number = r.required_str(kDive);
  d.deployment = r.str(kDeployment);

  d.deployed.julian_day = r.integer(kDepDay, 1, 366);
  d.deployed.hour = r.integer(kDepHour, 0, 23);
  d.deployed.minute = r.integer(kDepMin, 0, 59);
  d.recovered.julian_day = r.integer(kRecDay, 1, 366);
  d.recovered.hour = r.integer(kRecHour, 0, 23);
  d.recovered.minute = r.integer(kRecMin, 0, 59);
  return d;
}

// Column titles only: no cell of the row is a number. A data row with a bad
// first cell still carries numeric day/hour/minute cells and is parsed (and
// rejected) as data.
bool looks_like_header(const std::vector<std::string>& cells) {
  if (cells.empty()) return false;
  for (const auto& c : cells) {
    double v = 0.0;
    if (text::try_parse_double(c, v)) return false;
  }
  return true;
}

} // namespace

std::string DeploymentWindow::label() const {
  std::string s = dive_number + "_" + blanket_id;
  if (!deployment.empty()) s += "_" + deployment;
  return s;
}

double decimal_degrees(double degrees, double minutes) noexcept {
  return std::signbit(degrees) ? degrees - minutes / 60.0 : degrees + minutes / 60.0;
}

DeploymentTable::DeploymentTable(std::vector<DeploymentRow> rows, std::string source)
    : rows_(std::move(rows)), source_(std::move(source)) {}

DeploymentTable DeploymentTable::load(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IOError("Failed to open deployment file: " + path);
  }

  std::vector<DeploymentRow> rows;
  std::string line;
  std::size_t row = 0;
  bool first = true;
  while (std::getline(file, line)) {
    ++row;
    if (text::is_blank(line)) continue;

    const auto cells = text::split_csv_row(line);
    if (first) {
      first = false;
      if (looks_like_header(cells)) continue;
    }

    if (cells.size() != kColumnCount && cells.size() != kColumnCount - 1) {
      std::ostringstream oss;
      oss << "expected " << (kColumnCount - 1) << " or " << kColumnCount
          << " columns, found " << cells.size();
      throw MalformedRecordError(oss.str(), RecordContext{path, row, ""});
    }
    rows.push_back(parse_row(cells, path, row));
  }

  std::ostringstream oss;
  oss << "Loaded " << rows.size() << " deployment rows from " << path;
  log(LogLevel::INFO, oss.str());
  return DeploymentTable(std::move(rows), path);
}

DeploymentTable DeploymentTable::filter_blanket(const std::string& blanket_id) const {
  std::vector<DeploymentRow> kept;
  for (const auto& r : rows_) {
    if (r.blanket_id == blanket_id) kept.push_back(r);
  }
  return DeploymentTable(std::move(kept), source_);
}

std::vector<std::string> DeploymentTable::blanket_ids() const {
  std::set<std::string> ids;
  for (const auto& r : rows_) ids.insert(r.blanket_id);
  return std::vector<std::string>(ids.begin(), ids.end());
}

std::vector<DeploymentWindow> DeploymentTable::resolve(int year) const {
  return resolve(year, year);
}

std::vector<DeploymentWindow> DeploymentTable::resolve(int year, int last_data_year) const {
  std::vector<DeploymentWindow> windows;
  windows.reserve(rows_.size());

  for (const auto& r : rows_) {
    DeploymentWindow w;
    w.blanket_id = r.blanket_id;
    w.dive_number = r.dive_number;
    w.deployment = r.deployment;
    w.latitude_deg_part = r.latitude_deg_part;
    w.latitude_min_part = r.latitude_min_part;
    w.longitude_deg_part = r.longitude_deg_part;
    w.longitude_min_part = r.longitude_min_part;
    w.latitude_deg = decimal_degrees(r.latitude_deg_part, r.latitude_min_part);
    w.longitude_deg = decimal_degrees(r.longitude_deg_part, r.longitude_min_part);
    w.source_path = source_;
    w.source_row = r.row;

    // A recovery day before the deployment day only means "next year" when
    // the logger data actually reaches into that year.
    const bool rolls_over = r.recovered.julian_day < r.deployed.julian_day && last_data_year > year;
    const int rec_year = rolls_over ? year + 1 : year;
    if (rolls_over) {
      std::ostringstream oss;
      oss << source_ << " row " << r.row << ": recovery day " << r.recovered.julian_day
          << " before deployment day " << r.deployed.julian_day << ", recovery placed in " << rec_year;
      log(LogLevel::WARN, oss.str());
    }
    try {
      w.deployed_at = instant_from_julian_day(year, r.deployed.julian_day, r.deployed.hour, r.deployed.minute);
    } catch (const ValidationError& e) {
      throw MalformedRecordError(e.what(), RecordContext{source_, r.row, kColumnNames[kDepDay]});
    }
    try {
      w.recovered_at = instant_from_julian_day(rec_year, r.recovered.julian_day, r.recovered.hour, r.recovered.minute);
    } catch (const ValidationError& e) {
      throw MalformedRecordError(e.what(), RecordContext{source_, r.row, kColumnNames[kRecDay]});
    }

    if (!(w.deployed_at < w.recovered_at)) {
      std::ostringstream oss;
      oss << "dive " << w.dive_number << " (blanket " << w.blanket_id << ") recovered at "
          << format_iso8601(w.recovered_at) << ", not after deployment at "
          << format_iso8601(w.deployed_at);
      throw InvalidWindowError(oss.str(), RecordContext{source_, r.row, ""});
    }

    windows.push_back(std::move(w));
  }
  return windows;
}

} // namespace blanket
