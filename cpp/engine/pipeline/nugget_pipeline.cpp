#include "engine/pipeline/nugget_pipeline.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/exports/mat_file.hpp"
#include "engine/exports/nugget_report.hpp"
#include "engine/exports/records_csv.hpp"
#include "engine/io/antares_dat.hpp"
#include "engine/io/deployment_table.hpp"
#include "engine/io/offset_table.hpp"

#include <sstream>
#include <utility>

namespace blanket {

namespace {

InstrumentStream load_instrument(const std::string& path,
                                 const std::optional<std::string>& id_override,
                                 const char* role) {
  AntaresHeader header;
  InstrumentStream s;
  s.source_path = path;
  s.samples = read_antares_file(path, &header);

  if (id_override.has_value()) {
    s.logger_id = *id_override;
    if (!header.logger_id.empty() && header.logger_id != *id_override) {
      log(LogLevel::WARN, std::string(role) + " logger ID '" + header.logger_id +
                              "' from " + path + " overridden with '" + *id_override + "'");
    }
  } else {
    s.logger_id = header.logger_id;
  }

  if (s.logger_id.empty()) {
    throw MalformedRecordError(std::string(role) + " logger file carries no logger identifier",
                               RecordContext{path, 0, "LoggerIdentifier"});
  }
  return s;
}

// Calendar year of the latest sample in either file; fallback when both are empty.
int last_sample_year(const InstrumentStream& top, const InstrumentStream& bottom, int fallback) {
  bool any = false;
  Instant last;
  for (const auto* s : {&top, &bottom}) {
    for (const auto& smp : s->samples) {
      if (!any || last < smp.time) last = smp.time;
      any = true;
    }
  }
  return any ? to_calendar(last).year : fallback;
}

std::string join_ids(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ", ";
    out += id;
  }
  return out;
}

} // namespace

void PipelineConfig::validate_or_throw() const {
  if (top_path.empty()) throw ValidationError("PipelineConfig: top logger path is empty");
  if (bottom_path.empty()) throw ValidationError("PipelineConfig: bottom logger path is empty");
  if (offsets_path.empty()) throw ValidationError("PipelineConfig: offsets path is empty");
  if (deployments_path.empty()) throw ValidationError("PipelineConfig: deployments path is empty");
  if (csv_out.empty()) throw ValidationError("PipelineConfig: CSV output path is empty");
  if (mat_out.empty()) throw ValidationError("PipelineConfig: MAT output path is empty");
  if (csv_out == mat_out) throw ValidationError("PipelineConfig: CSV and MAT outputs are the same file");
  if (year.has_value() && (*year < 1900 || *year > 9999)) {
    throw ValidationError("PipelineConfig: year must be in [1900, 9999]");
  }
  if (top_logger_id.has_value() && top_logger_id->empty()) {
    throw ValidationError("PipelineConfig: top logger ID override is empty");
  }
  if (bottom_logger_id.has_value() && bottom_logger_id->empty()) {
    throw ValidationError("PipelineConfig: bottom logger ID override is empty");
  }
  settings.validate_or_throw();
}

PipelineSummary run_pipeline(const PipelineConfig& config) {
  config.validate_or_throw();

  // 1) loggers
  const InstrumentStream top = load_instrument(config.top_path, config.top_logger_id, "Top");
  const InstrumentStream bottom = load_instrument(config.bottom_path, config.bottom_logger_id, "Bottom");

  // 2) offsets + deployments
  const OffsetTable offsets = OffsetTable::load(config.offsets_path, config.settings.parse);

  DeploymentTable deployments = DeploymentTable::load(config.deployments_path);
  if (config.blanket_id.has_value()) {
    deployments = deployments.filter_blanket(*config.blanket_id);
    if (deployments.empty()) {
      throw ValidationError("No deployment rows for blanket '" + *config.blanket_id + "' in " +
                            config.deployments_path);
    }
  } else {
    const std::vector<std::string> ids = deployments.blanket_ids();
    if (ids.size() > 1) {
      throw ValidationError(config.deployments_path + " lists blankets " + join_ids(ids) +
                            "; one run covers one blanket, choose it with a blanket filter");
    }
  }

  int year = 0;
  if (config.year.has_value()) {
    year = *config.year;
  } else if (!top.samples.empty()) {
    year = to_calendar(top.samples.front().time).year;
  } else {
    throw NoDataError("Top logger file " + config.top_path + " has no samples to take the year from");
  }

  // 3) engine
  const std::vector<DeploymentWindow> windows =
      deployments.resolve(year, last_sample_year(top, bottom, year));
  const AlignmentResult result =
      align_and_correct(top, bottom, offsets, windows, config.settings.pairing);

  PipelineSummary summary;
  summary.top_logger_id = result.top_logger_id;
  summary.bottom_logger_id = result.bottom_logger_id;
  summary.top_offset_c = result.top_offset_c;
  summary.bottom_offset_c = result.bottom_offset_c;
  summary.year = year;
  summary.windows = result.groups.size();
  for (const auto& g : result.groups) {
    if (g.records.empty()) ++summary.empty_windows;
  }
  summary.stats = result.stats;

  if (result.record_count() == 0) {
    throw NoDataError("No paired record falls within any deployment window; nothing written");
  }

  // 4) exports
  if (!config.nugget_dir.empty()) check_nugget_file_names(result);
  write_records_csv_file(result, config.csv_out, CsvExportOptions::from(config.settings.exports));
  write_alignment_mat_file(result, config.mat_out);
  if (!config.nugget_dir.empty()) {
    summary.nugget_paths =
        write_nugget_reports(result, config.nugget_dir, NuggetSources{config.top_path, config.bottom_path});
  }

  std::ostringstream oss;
  oss << "Run complete: " << result.record_count() << " records in "
      << (summary.windows - summary.empty_windows) << "/" << summary.windows << " windows"
      << " (paired " << summary.stats.paired << ", outside windows " << summary.stats.outside_windows
      << ", unmatched top " << summary.stats.unmatched_top << ", unmatched bottom "
      << summary.stats.unmatched_bottom << ")";
  log(LogLevel::INFO, oss.str());
  return summary;
}

} // namespace blanket
