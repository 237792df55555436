/*
================================================================================
CLI: Main Entry Point (blanket_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Run the golden nugget pipeline for one blanket: two ANTARES logger files,
    an offset table and a deployment sheet in; corrected CSV, MAT-file and
    optional per-dive nugget reports out.

Usage:
  blanket_cli --top <dat> --bottom <dat> --offsets <csv> --deployments <csv>
              --csv <out.csv> --mat <out.mat> [options]

Hardening:
  - Explicit exit codes for scripting
  - No output file is written unless every input parsed and aligned
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/pipeline/nugget_pipeline.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace blanket;

namespace {

// Exit codes for scripting
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  INPUT_ERROR = 2,
  NO_DATA = 3,
  IO_ERROR = 4,
  UNEXPECTED = 5
};

void print_usage(std::ostream& os) {
  os <<
    "blanket_cli - Thermal Blanket golden nugget extraction\n"
    "\n"
    "Usage:\n"
    "  blanket_cli --top <dat> --bottom <dat> --offsets <csv> --deployments <csv>\n"
    "              --csv <out.csv> --mat <out.mat> [options]\n"
    "\n"
    "Options:\n"
    "  --nugget-dir <dir>     Also write one golden nugget report per dive\n"
    "  --blanket <id>         Only use deployment rows of this blanket\n"
    "                         (required when the sheet lists several)\n"
    "  --year <yyyy>          Year of the deployment Julian days\n"
    "                         (default: year of the first top sample)\n"
    "  --top-id <id>          Override the top file's LoggerIdentifier\n"
    "  --bottom-id <id>       Override the bottom file's LoggerIdentifier\n"
    "  --tolerance-s <s>      Max top/bottom time difference to pair (default 0)\n"
    "  --id-width <n>         Logger ID characters kept (default 7, 0 = all)\n"
    "  --log-level <level>    debug|info|warn|error (default info)\n"
    "  --help                 Show this help message\n"
    "\n"
    "Exit Codes:\n"
    "  0 - Success\n"
    "  1 - Invalid arguments\n"
    "  2 - Input data error\n"
    "  3 - No record within any deployment window\n"
    "  4 - I/O error\n"
    "  5 - Unexpected failure\n";
}

bool parse_long(const char* s, long* out) {
  if (!s || !out) return false;
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || errno == ERANGE) return false;
  *out = v;
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, PipelineConfig* c, std::string* err, bool* help_requested) {
  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      *help_requested = true;
      return true;
    }

    const char* v = nullptr;
    if (!get_next(i, argc, argv, &v)) {
      *err = std::string(k) + " requires a value";
      return false;
    }

    if (std::strcmp(k, "--top") == 0) { c->top_path = v; continue; }
    if (std::strcmp(k, "--bottom") == 0) { c->bottom_path = v; continue; }
    if (std::strcmp(k, "--offsets") == 0) { c->offsets_path = v; continue; }
    if (std::strcmp(k, "--deployments") == 0) { c->deployments_path = v; continue; }
    if (std::strcmp(k, "--csv") == 0) { c->csv_out = v; continue; }
    if (std::strcmp(k, "--mat") == 0) { c->mat_out = v; continue; }
    if (std::strcmp(k, "--nugget-dir") == 0) { c->nugget_dir = v; continue; }
    if (std::strcmp(k, "--blanket") == 0) { c->blanket_id = std::string(v); continue; }
    if (std::strcmp(k, "--top-id") == 0) { c->top_logger_id = std::string(v); continue; }
    if (std::strcmp(k, "--bottom-id") == 0) { c->bottom_logger_id = std::string(v); continue; }

    if (std::strcmp(k, "--year") == 0) {
      long n = 0;
      if (!parse_long(v, &n) || n < 1900 || n > 9999) { *err = "--year must be a year in [1900, 9999]"; return false; }
      c->year = static_cast<int>(n);
      continue;
    }

    if (std::strcmp(k, "--tolerance-s") == 0) {
      long n = 0;
      if (!parse_long(v, &n) || n < 0) { *err = "--tolerance-s must be a non-negative integer"; return false; }
      c->settings.pairing.tolerance_s = n;
      continue;
    }

    if (std::strcmp(k, "--id-width") == 0) {
      long n = 0;
      if (!parse_long(v, &n) || n < 0) { *err = "--id-width must be a non-negative integer"; return false; }
      c->settings.parse.logger_id_width = static_cast<std::size_t>(n);
      continue;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      LogLevel lvl = LogLevel::INFO;
      if (!parse_log_level(v, &lvl)) { *err = "--log-level must be debug, info, warn or error"; return false; }
      set_log_level(lvl);
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }

  if (c->top_path.empty()) { *err = "Missing --top"; return false; }
  if (c->bottom_path.empty()) { *err = "Missing --bottom"; return false; }
  if (c->offsets_path.empty()) { *err = "Missing --offsets"; return false; }
  if (c->deployments_path.empty()) { *err = "Missing --deployments"; return false; }
  if (c->csv_out.empty()) { *err = "Missing --csv"; return false; }
  if (c->mat_out.empty()) { *err = "Missing --mat"; return false; }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  PipelineConfig config;
  std::string err;
  bool help = false;

  if (!parse_args(argc, argv, &config, &err, &help)) {
    std::cerr << "blanket_cli: " << err << "\n\n";
    print_usage(std::cerr);
    return ExitCode::INVALID_ARGS;
  }
  if (help) {
    print_usage(std::cout);
    return ExitCode::SUCCESS;
  }

  try {
    const PipelineSummary s = run_pipeline(config);
    std::cout << "top " << s.top_logger_id << " (offset " << s.top_offset_c << " C), bottom "
              << s.bottom_logger_id << " (offset " << s.bottom_offset_c << " C): "
              << s.stats.windowed << " records in " << (s.windows - s.empty_windows) << " of "
              << s.windows << " windows\n";
    return ExitCode::SUCCESS;

  } catch (const InputError& e) {
    log(LogLevel::ERROR, std::string("Input error: ") + e.what());
    return ExitCode::INPUT_ERROR;
  } catch (const ValidationError& e) {
    log(LogLevel::ERROR, std::string("Validation failed: ") + e.what());
    return ExitCode::INPUT_ERROR;
  } catch (const NoDataError& e) {
    log(LogLevel::ERROR, e.what());
    return ExitCode::NO_DATA;
  } catch (const IOError& e) {
    log(LogLevel::ERROR, std::string("I/O error: ") + e.what());
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, std::string("Unexpected error: ") + e.what());
    return ExitCode::UNEXPECTED;
  }
}
