#include "engine/io/antares_dat.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text.hpp"

#include <sstream>
#include <utility>

namespace blanket {

namespace {

constexpr std::size_t kDataColumns = 9;

const char* const kColumnNames[kDataColumns] = {
  "year", "month", "day", "hour", "minute", "second",
  "raw_count", "resistance_ohm", "temperature_c",
};

bool is_comment(const std::string& line) {
  const std::size_t p = line.find_first_not_of(" \t");
  return p != std::string::npos && line[p] == '#';
}

// "## LoggerIdentifier    : 0000014" -> ("LoggerIdentifier", "0000014")
bool split_header_pair(const std::string& line, std::string* key, std::string* value) {
  std::size_t b = line.find_first_not_of("# \t");
  if (b == std::string::npos) return false;
  const std::size_t colon = line.find(':', b);
  if (colon == std::string::npos) return false;
  *key = text::trim(std::string_view(line).substr(b, colon - b));
  *value = text::trim(std::string_view(line).substr(colon + 1));
  return !key->empty();
}

} // namespace

SampleStream::SampleStream(std::string path) : path_(std::move(path)), in_(path_) {
  if (!in_.is_open()) {
    throw IOError("Failed to open logger file: " + path_);
  }
  read_header();
}

void SampleStream::read_header() {
  std::string line;
  std::streampos pos = in_.tellg();

  if (!std::getline(in_, line)) {
    throw MalformedRecordError("empty logger file", RecordContext{path_, 0, ""});
  }
  ++line_no_;
  if (line.rfind("##", 0) != 0) {
    throw MalformedRecordError("not an ANTARES export (first line must start with '##')",
                               RecordContext{path_, 1, "header"});
  }

  for (;;) {
    std::string key;
    std::string value;
    if (split_header_pair(line, &key, &value)) {
      header_.fields[key] = value;
    }

    pos = in_.tellg();
    if (!std::getline(in_, line)) {
      in_.clear();
      break;
    }
    if (!is_comment(line)) {
      in_.clear();
      in_.seekg(pos);
      break;
    }
    ++line_no_;
  }

  header_.header_lines = line_no_;
  data_start_ = pos;

  auto id = header_.fields.find("LoggerIdentifier");
  if (id != header_.fields.end()) header_.logger_id = id->second;

  auto count = header_.fields.find("TotalSampleCount");
  if (count != header_.fields.end()) {
    double n = 0.0;
    if (text::try_parse_double(count->second, n) && n >= 0.0) {
      header_.declared_sample_count = static_cast<long long>(n);
    }
  }
}

Sample SampleStream::parse_row(const std::string& row) const {
  const auto tokens = text::split_ws(row);
  if (tokens.size() != kDataColumns) {
    std::ostringstream oss;
    oss << "expected " << kDataColumns << " columns, found " << tokens.size();
    throw MalformedRecordError(oss.str(), RecordContext{path_, line_no_, ""});
  }

  int cal[6] = {0, 0, 0, 0, 0, 0};
  for (std::size_t i = 0; i < 6; ++i) {
    if (!text::try_parse_int(tokens[i], cal[i])) {
      throw MalformedRecordError("not an integer: '" + tokens[i] + "'",
                                 RecordContext{path_, line_no_, kColumnNames[i]});
    }
  }

  double num[3] = {0.0, 0.0, 0.0};
  for (std::size_t i = 0; i < 3; ++i) {
    if (!text::try_parse_double(tokens[6 + i], num[i])) {
      throw MalformedRecordError("not a number: '" + tokens[6 + i] + "'",
                                 RecordContext{path_, line_no_, kColumnNames[6 + i]});
    }
  }

  Sample s;
  try {
    s.time = instant_from_calendar(cal[0], cal[1], cal[2], cal[3], cal[4], cal[5]);
  } catch (const ValidationError& e) {
    throw MalformedRecordError(std::string("invalid timestamp: ") + e.what(),
                               RecordContext{path_, line_no_, "timestamp"});
  }
  s.raw_count = num[0];
  s.resistance_ohm = num[1];
  s.temperature_c = num[2];
  return s;
}

bool SampleStream::next(Sample* out) {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_no_;
    if (text::is_blank(line) || is_comment(line)) continue;
    const Sample s = parse_row(line);
    if (out) *out = s;
    return true;
  }
  return false;
}

void SampleStream::restart() {
  in_.clear();
  in_.seekg(data_start_);
  line_no_ = header_.header_lines;
}

std::vector<Sample> read_all_samples(SampleStream& stream) {
  std::vector<Sample> samples;
  if (stream.header().declared_sample_count) {
    const long long hint = *stream.header().declared_sample_count;
    samples.reserve(static_cast<std::size_t>(hint < (1LL << 24) ? hint : (1LL << 24)));
  }

  Sample s;
  while (stream.next(&s)) samples.push_back(s);

  const auto& declared = stream.header().declared_sample_count;
  if (declared && *declared != static_cast<long long>(samples.size())) {
    std::ostringstream oss;
    oss << stream.path() << ": header declares " << *declared << " samples, read "
        << samples.size();
    log(LogLevel::WARN, oss.str());
  }
  return samples;
}

std::vector<Sample> read_antares_file(const std::string& path, AntaresHeader* header_out) {
  SampleStream stream(path);
  auto samples = read_all_samples(stream);
  if (header_out) *header_out = stream.header();

  std::ostringstream oss;
  oss << "Read " << samples.size() << " samples from " << path;
  if (!stream.header().logger_id.empty()) oss << " (logger " << stream.header().logger_id << ")";
  log(LogLevel::INFO, oss.str());
  return samples;
}

} // namespace blanket
