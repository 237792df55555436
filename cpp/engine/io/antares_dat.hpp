#pragma once
/*
================================================================================
IO: ANTARES Logger Export Reader
FILE: cpp/engine/io/antares_dat.hpp

Purpose:
  - Read one thermistor logger's .dat export into Samples, in file order.
  - Lazy and restartable: SampleStream::next() parses one row at a time,
    restart() rewinds to the first data row.

Format:
  #######################################################################
  ##
  ## LoggerIdentifier    : 0000014
  ## TotalSampleCount    :    113908
  ## ...
  #######################################################################
  2003 07 16 15 00 04    32114    45981.044       16.088

  Data columns: year month day hour minute second raw_count resistance_ohm
  temperature_c.

Errors:
  - MalformedRecordError on a non-ANTARES file or any row that does not
    match the nine-column schema (the whole file is rejected).
  - IOError when the file cannot be opened.
================================================================================
*/

#include "engine/core/instant.hpp"

#include <cstddef>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blanket {

struct Sample {
  Instant time{};
  double raw_count = 0.0;
  double resistance_ohm = 0.0;
  double temperature_c = 0.0;
};

struct AntaresHeader {
  // Value of "LoggerIdentifier", empty if the header does not carry one.
  std::string logger_id;

  // Value of "TotalSampleCount" when present and numeric.
  std::optional<long long> declared_sample_count;

  // Every "Key : Value" pair, trimmed.
  std::map<std::string, std::string> fields;

  // Number of header lines (data starts on line header_lines + 1).
  std::size_t header_lines = 0;
};

class SampleStream {
 public:
  // Opens the file and parses the header. Throws IOError / MalformedRecordError.
  explicit SampleStream(std::string path);

  SampleStream(const SampleStream&) = delete;
  SampleStream& operator=(const SampleStream&) = delete;

  const std::string& path() const noexcept { return path_; }
  const AntaresHeader& header() const noexcept { return header_; }

  // Line number of the last line read (1-based).
  std::size_t line() const noexcept { return line_no_; }

  // Parses the next data row into *out. Returns false at end of file.
  bool next(Sample* out);

  // Rewinds to the first data row.
  void restart();

 private:
  void read_header();
  Sample parse_row(const std::string& row) const;

  std::string path_;
  std::ifstream in_;
  AntaresHeader header_;
  std::streampos data_start_{};
  std::size_t line_no_ = 0;
};

// Drains the stream from its current position. Warns when the count differs
// from the header's TotalSampleCount.
std::vector<Sample> read_all_samples(SampleStream& stream);

// Convenience: open + read everything.
std::vector<Sample> read_antares_file(const std::string& path, AntaresHeader* header_out = nullptr);

} // namespace blanket
