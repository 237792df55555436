#pragma once
/*
================================================================================
Pipeline: One Blanket Run (golden nugget extraction)
FILE: cpp/engine/pipeline/nugget_pipeline.hpp

Purpose:
  - Wire parser, offset table, deployment table, alignment engine and
    exporters for one blanket (one top + one bottom logger file).

Ordering contract:
  1) read top + bottom logger files
  2) load offsets, load deployments (one blanket: the filtered one, or the
     only one the sheet lists; a sheet with several needs a filter)
  3) resolve windows for the run year, align and correct
  4) only when 1-3 succeeded and at least one record is windowed:
     write CSV, MAT-file, nugget reports
  A failure in 1-3 leaves no output file behind for this run.

Run year:
  - PipelineConfig::year when set, otherwise the year of the first top sample.
  - A recovery day before the deployment day rolls into the next year only
    when the latest top or bottom sample lies beyond the run year.
================================================================================
*/

#include "engine/align/alignment.hpp"
#include "engine/core/settings.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace blanket {

struct PipelineConfig {
  std::string top_path;
  std::string bottom_path;
  std::string offsets_path;
  std::string deployments_path;

  std::string csv_out;
  std::string mat_out;
  std::string nugget_dir;  // empty = no nugget reports

  // Override the LoggerIdentifier of a file's header.
  std::optional<std::string> top_logger_id;
  std::optional<std::string> bottom_logger_id;

  std::optional<int> year;
  std::optional<std::string> blanket_id;  // keep only this blanket's rows

  PipelineSettings settings = PipelineSettings::defaults();

  // Throws ValidationError.
  void validate_or_throw() const;
};

struct PipelineSummary {
  std::string top_logger_id;
  std::string bottom_logger_id;
  double top_offset_c = 0.0;
  double bottom_offset_c = 0.0;

  int year = 0;
  std::size_t windows = 0;
  std::size_t empty_windows = 0;
  AlignmentStats stats{};

  std::vector<std::string> nugget_paths;
};

// Throws InputError subclasses / ValidationError / IOError / NoDataError.
PipelineSummary run_pipeline(const PipelineConfig& config);

} // namespace blanket
