#include "engine/align/alignment.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace blanket {

namespace {

std::int64_t abs_gap(const Instant& a, const Instant& b) noexcept {
  const std::int64_t d = seconds_between(a, b);
  return d < 0 ? -d : d;
}

void sort_by_time(std::vector<Sample>& v) {
  std::stable_sort(v.begin(), v.end(),
                   [](const Sample& a, const Sample& b) { return a.time < b.time; });
}

ChannelReading correct(const Sample& s, double offset_c) noexcept {
  ChannelReading c;
  c.raw_count = s.raw_count;
  c.resistance_ohm = s.resistance_ohm;
  c.temperature_c = s.temperature_c;
  c.corrected_c = s.temperature_c + offset_c;
  return c;
}

std::string describe(const DeploymentWindow& w) {
  std::ostringstream oss;
  oss << "dive " << w.dive_number << " (blanket " << w.blanket_id << ", row " << w.source_row
      << ", " << format_iso8601(w.deployed_at) << " .. " << format_iso8601(w.recovered_at) << ")";
  return oss.str();
}

} // namespace

PairingOutcome pair_by_timestamp(std::vector<Sample> top,
                                 std::vector<Sample> bottom,
                                 const PairingSettings& settings) {
  settings.validate_or_throw();
  sort_by_time(top);
  sort_by_time(bottom);

  const std::int64_t tol = settings.tolerance_s;
  PairingOutcome out;
  out.pairs.reserve(std::min(top.size(), bottom.size()));

  std::size_t i = 0;
  std::size_t j = 0;
  while (i < top.size() && j < bottom.size()) {
    const std::int64_t dt = seconds_between(top[i].time, bottom[j].time);
    if (dt < -tol) {
      ++out.unmatched_bottom;
      ++j;
      continue;
    }
    if (dt > tol) {
      ++out.unmatched_top;
      ++i;
      continue;
    }

    // Within tolerance. Give way if a neighbour is a strictly closer match.
    const std::int64_t gap = dt < 0 ? -dt : dt;
    if (j + 1 < bottom.size() && abs_gap(top[i].time, bottom[j + 1].time) < gap) {
      ++out.unmatched_bottom;
      ++j;
      continue;
    }
    if (i + 1 < top.size() && abs_gap(top[i + 1].time, bottom[j].time) < gap) {
      ++out.unmatched_top;
      ++i;
      continue;
    }

    out.pairs.push_back(SamplePair{top[i], bottom[j]});
    ++i;
    ++j;
  }
  out.unmatched_top += top.size() - i;
  out.unmatched_bottom += bottom.size() - j;
  return out;
}

std::vector<DeploymentWindow> order_disjoint_windows(const std::vector<DeploymentWindow>& windows) {
  std::vector<DeploymentWindow> ordered = windows;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const DeploymentWindow& a, const DeploymentWindow& b) {
                     return a.deployed_at < b.deployed_at;
                   });

  for (std::size_t k = 1; k < ordered.size(); ++k) {
    const auto& prev = ordered[k - 1];
    const auto& cur = ordered[k];
    if (cur.deployed_at <= prev.recovered_at) {
      throw OverlappingWindowError(describe(cur) + " overlaps " + describe(prev),
                                   RecordContext{cur.source_path, cur.source_row, ""});
    }
  }
  return ordered;
}

long find_window(const std::vector<DeploymentWindow>& ordered, const Instant& t) noexcept {
  // Last window deployed at or before t.
  auto it = std::upper_bound(ordered.begin(), ordered.end(), t,
                             [](const Instant& v, const DeploymentWindow& w) { return v < w.deployed_at; });
  if (it == ordered.begin()) return -1;
  --it;
  if (!it->contains(t)) return -1;
  return static_cast<long>(it - ordered.begin());
}

AlignmentResult align_and_correct(const InstrumentStream& top,
                                  const InstrumentStream& bottom,
                                  const OffsetTable& offsets,
                                  const std::vector<DeploymentWindow>& windows,
                                  const PairingSettings& settings) {
  settings.validate_or_throw();

  AlignmentResult result;
  result.top_logger_id = normalize_logger_id(top.logger_id, offsets.logger_id_width());
  result.bottom_logger_id = normalize_logger_id(bottom.logger_id, offsets.logger_id_width());

  // 1) offsets
  result.top_offset_c = offsets.require(top.logger_id, RecordContext{top.source_path, 0, "LoggerIdentifier"});
  result.bottom_offset_c = offsets.require(bottom.logger_id, RecordContext{bottom.source_path, 0, "LoggerIdentifier"});

  const auto ordered = order_disjoint_windows(windows);

  // 3) pairing (correction is applied per pair below; it is a pure shift)
  PairingOutcome pairing = pair_by_timestamp(top.samples, bottom.samples, settings);

  result.stats.top_samples = top.samples.size();
  result.stats.bottom_samples = bottom.samples.size();
  result.stats.paired = pairing.pairs.size();
  result.stats.unmatched_top = pairing.unmatched_top;
  result.stats.unmatched_bottom = pairing.unmatched_bottom;

  result.groups.reserve(ordered.size());
  for (const auto& w : ordered) result.groups.push_back(WindowGroup{w, {}});

  // 2) + 4) + 5)
  for (const auto& p : pairing.pairs) {
    const long k = find_window(ordered, p.top.time);
    if (k < 0) {
      ++result.stats.outside_windows;
      continue;
    }

    CorrectedRecord r;
    r.time = p.top.time;
    r.top = correct(p.top, result.top_offset_c);
    r.bottom = correct(p.bottom, result.bottom_offset_c);
    r.differential_c = r.top.corrected_c - r.bottom.corrected_c;
    result.groups[static_cast<std::size_t>(k)].records.push_back(r);
    ++result.stats.windowed;
  }

  if (pairing.unmatched_top > 0 || pairing.unmatched_bottom > 0) {
    std::ostringstream oss;
    oss << "Timing differs between top and bottom loggers: " << pairing.unmatched_top
        << " top and " << pairing.unmatched_bottom << " bottom samples left unpaired";
    log(LogLevel::WARN, oss.str());
  }

  for (const auto& g : result.groups) {
    std::ostringstream oss;
    if (g.records.empty()) {
      oss << "No records within deployment window " << describe(g.window);
      log(LogLevel::WARN, oss.str());
    } else {
      oss << "Found " << g.records.size() << " records within deployment window " << describe(g.window);
      log(LogLevel::INFO, oss.str());
    }
  }
  return result;
}

} // namespace blanket
