#pragma once
/*
================================================================================
IO: Blanket Deployment Metadata
FILE: cpp/engine/io/deployment_table.hpp

Purpose:
  - Load the per-blanket deployment sheet (one row per dive) and turn each
    row's (Julian day, hour, minute) triples into absolute deployment and
    recovery instants.

File format (CSV, optional header row):
  Latitude(Degree), Latitude(Minutes), Longitude(Degree), Long(Dec Min),
  Blanket, Dive number, [Deployment], Date Deployed (Julian day),
  Deployed Time (Hour), Deployed Time (Min), Date Recovered (Julian day),
  Time Recovered (Hour), Time Recovered (Min)

  12 columns, or 13 when the sheet carries a deployment label.

Year handling:
  - The sheet has no year. resolve() places deployment in `year`; a
    recovery Julian day smaller than the deployment one rolls into year + 1
    when the logger data reaches that year, and is invalid otherwise.
================================================================================
*/

#include "engine/core/instant.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace blanket {

struct DayTime {
  int julian_day = 1;
  int hour = 0;
  int minute = 0;
};

// One sheet row, typed but not yet placed in a year.
struct DeploymentRow {
  double latitude_deg_part = 0.0;
  double latitude_min_part = 0.0;
  double longitude_deg_part = 0.0;
  double longitude_min_part = 0.0;
  std::string blanket_id;
  std::string dive_number;
  std::string deployment;  // empty for 12-column sheets
  DayTime deployed{};
  DayTime recovered{};
  std::size_t row = 0;     // 1-based line in the sheet
};

struct DeploymentWindow {
  std::string blanket_id;
  std::string dive_number;
  std::string deployment;

  double latitude_deg = 0.0;   // decimal degrees, north positive
  double longitude_deg = 0.0;  // decimal degrees, east positive
  double latitude_deg_part = 0.0;
  double latitude_min_part = 0.0;
  double longitude_deg_part = 0.0;
  double longitude_min_part = 0.0;

  Instant deployed_at{};
  Instant recovered_at{};

  std::string source_path;
  std::size_t source_row = 0;

  // Closed interval: both endpoints belong to the window.
  bool contains(const Instant& t) const noexcept {
    return deployed_at <= t && t <= recovered_at;
  }

  // "<dive>_<blanket>" or "<dive>_<blanket>_<deployment>".
  std::string label() const;
};

// deg + sign(deg) * minutes / 60, sign taken from the degree field (-0 counts
// as negative).
double decimal_degrees(double degrees, double minutes) noexcept;

class DeploymentTable {
 public:
  DeploymentTable() = default;
  DeploymentTable(std::vector<DeploymentRow> rows, std::string source);

  // Throws IOError / MalformedRecordError.
  static DeploymentTable load(const std::string& path);

  // Rows of one blanket only (file order kept).
  DeploymentTable filter_blanket(const std::string& blanket_id) const;

  // Distinct blanket IDs, sorted.
  std::vector<std::string> blanket_ids() const;

  // Throws MalformedRecordError (day not in that year) / InvalidWindowError
  // (recovery not after deployment). File order kept.
  // last_data_year is the year of the latest logger sample: a recovery day
  // smaller than the deployment day rolls into year + 1 only when
  // last_data_year > year, otherwise the row is an InvalidWindowError.
  std::vector<DeploymentWindow> resolve(int year, int last_data_year) const;

  // resolve(year, year): no rollover.
  std::vector<DeploymentWindow> resolve(int year) const;

  const std::vector<DeploymentRow>& rows() const noexcept { return rows_; }
  std::size_t size() const noexcept { return rows_.size(); }
  bool empty() const noexcept { return rows_.empty(); }
  const std::string& source() const noexcept { return source_; }

 private:
  std::vector<DeploymentRow> rows_;
  std::string source_;
};

} // namespace blanket
