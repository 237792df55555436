#pragma once
/*
================================================================================
Engine: Corrected Records CSV Exporter
FILE: cpp/engine/exports/records_csv.hpp

Purpose:
  - One row per corrected, windowed record, joined with the metadata of the
    deployment window it belongs to.

Hardening:
  - Explicit CSV escaping for strings with commas/quotes
  - Fixed-point formatting with configured precision, "\n" line endings:
    identical inputs give byte-identical files
  - Stable column ordering

Columns:
  blanket, dive, deployment, latitude_deg, longitude_deg, timestamp_utc,
  datenum, julian_day, top_raw_c, top_corrected_c, bottom_raw_c,
  bottom_corrected_c, differential_c
================================================================================
*/

#include "engine/align/alignment.hpp"
#include "engine/core/settings.hpp"

#include <string>

namespace blanket {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int temperature_precision = ExportSettings{}.temperature_precision;
  int datenum_precision = ExportSettings{}.datenum_precision;

  static CsvExportOptions from(const ExportSettings& s) {
    CsvExportOptions o;
    o.temperature_precision = s.temperature_precision;
    o.datenum_precision = s.datenum_precision;
    return o;
  }
};

std::string get_records_csv_header(const CsvExportOptions& opt = CsvExportOptions());

std::string record_to_csv_row(const WindowGroup& group,
                              const CorrectedRecord& r,
                              const CsvExportOptions& opt = CsvExportOptions());

// Whole document, groups in result order.
std::string format_records_csv(const AlignmentResult& result,
                               const CsvExportOptions& opt = CsvExportOptions());

// Overwrites file_path. Throws IOError.
void write_records_csv_file(const AlignmentResult& result,
                            const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

} // namespace blanket
