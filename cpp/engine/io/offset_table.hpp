#pragma once
/*
================================================================================
IO: Logger Offset Table
FILE: cpp/engine/io/offset_table.hpp

Purpose:
  - Immutable logger ID -> additive temperature offset [deg C] mapping,
    built once per run and passed explicitly to the alignment engine.

File format:
  CSV, no header row, two columns per row: logger ID, offset.
    0000014,0.0125
    0000027,-0.0041

Policy:
  - IDs are normalized (trimmed, cut to ParseSettings::logger_id_width).
  - Repeated ID with the same offset: accepted.
  - Repeated ID with a different offset: DuplicateLoggerIdError.
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blanket {

struct LoggerOffset {
  std::string logger_id;
  double offset_c = 0.0;
};

// Trim whitespace, then keep the first `width` characters (width 0 = all).
std::string normalize_logger_id(std::string_view raw, std::size_t width);

class OffsetTable {
 public:
  OffsetTable() = default;

  // Builds from explicit entries (row numbers are positions, 1-based).
  // Throws DuplicateLoggerIdError / MalformedRecordError.
  explicit OffsetTable(const std::vector<LoggerOffset>& entries,
                       std::size_t logger_id_width = ParseSettings{}.logger_id_width);

  // Loads an offsets CSV. Throws IOError / MalformedRecordError /
  // DuplicateLoggerIdError.
  static OffsetTable load(const std::string& path, const ParseSettings& settings = ParseSettings{});

  std::optional<double> find(std::string_view logger_id) const;

  // Like find() but throws UnknownLoggerIdError carrying `where`.
  double require(std::string_view logger_id, const RecordContext& where) const;

  bool contains(std::string_view logger_id) const { return find(logger_id).has_value(); }
  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  std::size_t logger_id_width() const noexcept { return width_; }
  const std::string& source() const noexcept { return source_; }

 private:
  struct Entry {
    double offset_c = 0.0;
    std::size_t row = 0;
  };

  void insert(const std::string& raw_id, double offset_c, std::size_t row);

  std::map<std::string, Entry> entries_;
  std::size_t width_ = ParseSettings{}.logger_id_width;
  std::string source_;
};

} // namespace blanket
