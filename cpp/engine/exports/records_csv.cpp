/*
================================================================================
Engine: Corrected Records CSV Exporter Implementation
FILE: cpp/engine/exports/records_csv.cpp
================================================================================
*/

#include "engine/exports/records_csv.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>

namespace blanket {

// Helper: escape CSV string (quote if contains delimiter/quote/newline)
static std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Helper: fixed-point double, empty string if NaN/Inf
static std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(precision) << x;
  std::string s = oss.str();
  // "-0.000000" and "0.000000" must not differ between runs of equal data.
  if (s[0] == '-' && s.find_first_not_of("-0.") == std::string::npos) s.erase(0, 1);
  return s;
}

std::string get_records_csv_header(const CsvExportOptions& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;

  // Window identity + location
  h << "blanket" << d << "dive" << d << "deployment" << d
    << "latitude_deg" << d << "longitude_deg" << d;

  // Time
  h << "timestamp_utc" << d << "datenum" << d << "julian_day" << d;

  // Temperatures
  h << "top_raw_c" << d
    << "top_corrected_c" << d
    << "bottom_raw_c" << d
    << "bottom_corrected_c" << d
    << "differential_c";

  return h.str();
}

std::string record_to_csv_row(const WindowGroup& group, const CorrectedRecord& r, const CsvExportOptions& opt) {
  std::ostringstream row;
  const char d = opt.delimiter;
  const int tp = opt.temperature_precision;
  const auto& w = group.window;

  row << csv_escape(w.blanket_id, d) << d
      << csv_escape(w.dive_number, d) << d
      << csv_escape(w.deployment, d) << d
      << csv_double(w.latitude_deg, tp) << d
      << csv_double(w.longitude_deg, tp) << d;

  row << format_iso8601(r.time) << d
      << csv_double(to_datenum(r.time), opt.datenum_precision) << d
      << julian_day_of(r.time) << d;

  row << csv_double(r.top.temperature_c, tp) << d
      << csv_double(r.top.corrected_c, tp) << d
      << csv_double(r.bottom.temperature_c, tp) << d
      << csv_double(r.bottom.corrected_c, tp) << d
      << csv_double(r.differential_c, tp);

  return row.str();
}

std::string format_records_csv(const AlignmentResult& result, const CsvExportOptions& opt) {
  std::string out;
  if (opt.include_header) {
    out += get_records_csv_header(opt);
    out += '\n';
  }
  for (const auto& g : result.groups) {
    for (const auto& r : g.records) {
      out += record_to_csv_row(g, r, opt);
      out += '\n';
    }
  }
  return out;
}

void write_records_csv_file(const AlignmentResult& result,
                            const std::string& file_path,
                            const CsvExportOptions& opt) {
  std::ofstream ofs(file_path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!ofs.is_open()) {
    throw IOError("Failed to open CSV output: " + file_path);
  }

  ofs << format_records_csv(result, opt);
  ofs.close();
  if (!ofs) {
    throw IOError("Failed to write CSV output: " + file_path);
  }

  std::ostringstream oss;
  oss << "Wrote " << result.record_count() << " records to " << file_path;
  log(LogLevel::INFO, oss.str());
}

} // namespace blanket
