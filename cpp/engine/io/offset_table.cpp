#include "engine/io/offset_table.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/text.hpp"

#include <fstream>
#include <sstream>

namespace blanket {

std::string normalize_logger_id(std::string_view raw, std::size_t width) {
  std::string id = text::trim(raw);
  if (width > 0 && id.size() > width) id.resize(width);
  return id;
}

OffsetTable::OffsetTable(const std::vector<LoggerOffset>& entries, std::size_t logger_id_width)
    : width_(logger_id_width) {
  std::size_t row = 0;
  for (const auto& e : entries) {
    insert(e.logger_id, e.offset_c, ++row);
  }
}

void OffsetTable::insert(const std::string& raw_id, double offset_c, std::size_t row) {
  const std::string id = normalize_logger_id(raw_id, width_);
  if (id.empty()) {
    throw MalformedRecordError("empty logger ID", RecordContext{source_, row, "logger_id"});
  }

  auto it = entries_.find(id);
  if (it == entries_.end()) {
    entries_.emplace(id, Entry{offset_c, row});
    return;
  }

  if (it->second.offset_c == offset_c) {
    std::ostringstream oss;
    oss << "Offset for logger " << id << " repeated on row " << row
        << " (same value as row " << it->second.row << ")";
    log(LogLevel::DEBUG, oss.str());
    return;
  }

  std::ostringstream oss;
  oss << "logger '" << id << "' has offset " << it->second.offset_c << " on row "
      << it->second.row << " and " << offset_c << " on row " << row;
  throw DuplicateLoggerIdError(oss.str(), RecordContext{source_, row, "logger_id"});
}

OffsetTable OffsetTable::load(const std::string& path, const ParseSettings& settings) {
  settings.validate_or_throw();

  std::ifstream file(path);
  if (!file.is_open()) {
    throw IOError("Failed to open offset file: " + path);
  }

  OffsetTable table;
  table.width_ = settings.logger_id_width;
  table.source_ = path;

  std::string line;
  std::size_t row = 0;
  while (std::getline(file, line)) {
    ++row;
    if (text::is_blank(line)) continue;

    const auto cells = text::split_csv_row(line);
    if (cells.size() != 2) {
      std::ostringstream oss;
      oss << "expected 2 columns (logger ID, offset), found " << cells.size();
      throw MalformedRecordError(oss.str(), RecordContext{path, row, ""});
    }

    double offset = 0.0;
    if (!text::try_parse_double(cells[1], offset)) {
      throw MalformedRecordError("offset is not a number: '" + text::trim(cells[1]) + "'",
                                 RecordContext{path, row, "offset"});
    }
    table.insert(cells[0], offset, row);
  }

  std::ostringstream oss;
  oss << "Loaded " << table.size() << " logger offsets from " << path;
  log(LogLevel::INFO, oss.str());
  return table;
}

std::optional<double> OffsetTable::find(std::string_view logger_id) const {
  auto it = entries_.find(normalize_logger_id(logger_id, width_));
  if (it == entries_.end()) return std::nullopt;
  return it->second.offset_c;
}

double OffsetTable::require(std::string_view logger_id, const RecordContext& where) const {
  const auto offset = find(logger_id);
  if (!offset) {
    throw UnknownLoggerIdError(normalize_logger_id(logger_id, width_), where);
  }
  return *offset;
}

} // namespace blanket
