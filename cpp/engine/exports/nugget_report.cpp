#include "engine/exports/nugget_report.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace blanket {

namespace {

const char* const kMonthAbbrev[12] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

const char* const kRule = "--------------------------------------------------------\n";

std::string base_name(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

std::string format_table_row(const CorrectedRecord& r) {
  char buf[192];
  std::snprintf(buf, sizeof(buf),
                "%s  %9.0f %11.4f %9.4f %9.4f  %9.0f %11.4f %9.4f %9.4f\n",
                format_nugget_time(r.time).c_str(),
                r.bottom.raw_count, r.bottom.resistance_ohm, r.bottom.temperature_c, r.bottom.corrected_c,
                r.top.raw_count, r.top.resistance_ohm, r.top.temperature_c, r.top.corrected_c);
  return buf;
}

} // namespace

std::string format_nugget_time(const Instant& t) {
  const CalendarTime c = to_calendar(t);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d-%s-%04d %02d:%02d:%02d",
                c.day, kMonthAbbrev[c.month - 1], c.year, c.hour, c.minute, c.second);
  return buf;
}

std::string nugget_file_name(const DeploymentWindow& w) {
  std::string name = w.label();
  for (char& ch : name) {
    const bool ok = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                    (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' || ch == '-';
    if (!ok) ch = '_';
  }
  return name + ".dat";
}

std::string format_nugget_report(const AlignmentResult& result,
                                 const WindowGroup& group,
                                 const NuggetSources& sources) {
  const DeploymentWindow& w = group.window;
  std::ostringstream out;
  char buf[160];

  out << "----------------------- Begin Header ---------------------\n";
  out << " Blanket Letter             : " << w.blanket_id << "\n";
  out << " Blanket Deployment         : " << w.label() << "\n";
  out << " \n";
  std::snprintf(buf, sizeof(buf), "%1.4f", result.bottom_offset_c);
  out << " Bottom Thermistor ID       : " << result.bottom_logger_id << "\n";
  out << " Bottom Thermistor Filename : " << base_name(sources.bottom_path) << "\n";
  out << " Bottom Thermistor Offset   : " << buf << " [deg C]\n";
  out << " \n";
  std::snprintf(buf, sizeof(buf), "%1.4f", result.top_offset_c);
  out << " Top Thermistor ID          : " << result.top_logger_id << "\n";
  out << " Top Thermistor Filename    : " << base_name(sources.top_path) << "\n";
  out << " Top Thermistor Offset      : " << buf << " [deg C]\n";
  out << kRule;

  out << " Deployment Location Information\n";
  std::snprintf(buf, sizeof(buf),
                " Lon [deg]     : %.0f\n Lon [dec-min] : %f\n Lat [deg]     : %.0f\n Lat [dec-min] : %f\n",
                w.longitude_deg_part, w.longitude_min_part, w.latitude_deg_part, w.latitude_min_part);
  out << buf;
  out << kRule;

  out << " Deployment Time Information\n";
  out << " Date/Time Deployed  : " << format_nugget_time(w.deployed_at) << "\n";
  out << " Date/Time Recovered : " << format_nugget_time(w.recovered_at) << "\n";
  out << "-------------------------- End Header -------------------\n";
  out << " \n";

  out << "  Date-Time                Bottom      Bottom    Bottom    Bottom        Top         Top       Top       Top\n";
  out << "                            [raw]       [ohm]      T[C] T(offset)      [raw]       [ohm]      T[C] T(offset)\n";
  for (const auto& r : group.records) out << format_table_row(r);

  return out.str();
}

void check_nugget_file_names(const AlignmentResult& result) {
  std::map<std::string, const DeploymentWindow*> seen;
  for (const auto& g : result.groups) {
    if (g.records.empty()) continue;
    const std::string name = nugget_file_name(g.window);
    const auto ins = seen.emplace(name, &g.window);
    if (!ins.second) {
      std::ostringstream oss;
      oss << "Nugget report name " << name << " is shared by deployment rows "
          << ins.first->second->source_row << " and " << g.window.source_row << " of "
          << g.window.source_path;
      throw IOError(oss.str());
    }
  }
}

std::vector<std::string> write_nugget_reports(const AlignmentResult& result,
                                              const std::string& dir,
                                              const NuggetSources& sources) {
  check_nugget_file_names(result);

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw IOError("Failed to create nugget directory " + dir + ": " + ec.message());
  }

  std::vector<std::string> written;
  for (const auto& g : result.groups) {
    if (g.records.empty()) continue;

    const std::string path = (std::filesystem::path(dir) / nugget_file_name(g.window)).string();
    std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!ofs.is_open()) {
      throw IOError("Failed to open nugget report: " + path);
    }
    ofs << format_nugget_report(result, g, sources);
    ofs.close();
    if (!ofs) {
      throw IOError("Failed to write nugget report: " + path);
    }

    std::ostringstream oss;
    oss << "Wrote golden nugget " << path << " (" << g.records.size() << " records)";
    log(LogLevel::INFO, oss.str());
    written.push_back(path);
  }
  return written;
}

} // namespace blanket
