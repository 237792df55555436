#pragma once
/*
================================================================================
Engine: Golden Nugget Report
FILE: cpp/engine/exports/nugget_report.hpp

Purpose:
  - Human-readable per-dive extract: one text file per deployment window that
    received records, named "<dive>_<blanket>[_<deployment>].dat".
  - Header block (blanket, logger IDs, source files, offsets, location,
    deployment/recovery times) followed by a fixed-width table of bottom and
    top readings: raw count, resistance, temperature, corrected temperature.

Hardening:
  - Empty windows produce no file.
  - Characters outside [A-Za-z0-9._-] in the file name become '_'.
================================================================================
*/

#include "engine/align/alignment.hpp"

#include <string>
#include <vector>

namespace blanket {

// Where the two logger streams came from (printed in the header).
struct NuggetSources {
  std::string top_path;
  std::string bottom_path;
};

// "07-Feb-2011 12:30:00"
std::string format_nugget_time(const Instant& t);

// File name (no directory) for one window.
std::string nugget_file_name(const DeploymentWindow& w);

std::string format_nugget_report(const AlignmentResult& result,
                                 const WindowGroup& group,
                                 const NuggetSources& sources);

// Throws IOError when two non-empty windows map to the same file name.
void check_nugget_file_names(const AlignmentResult& result);

// Creates dir if needed and writes one report per non-empty window.
// Checks file names first; on a clash nothing is written.
// Returns the paths written, in group order. Throws IOError.
std::vector<std::string> write_nugget_reports(const AlignmentResult& result,
                                              const std::string& dir,
                                              const NuggetSources& sources);

} // namespace blanket
