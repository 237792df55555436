/*
  Alignment & Correction Selftest

  Validates the engine on in-memory inputs:
    1) corrected = raw + offset, differential = top - bottom
    2) closed-interval windows: endpoints in, later samples out
    3) overlapping (including touching) windows rejected up front
    4) unknown logger IDs rejected before any pairing
    5) pairing: strict equality by default, nearest neighbour within tolerance
    6) output ordering: groups by deployment, records ascending, empty
       windows kept

  Non-zero return code indicates failure.
*/

#include "engine/align/alignment.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/testing/selftest_util.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace blanket {
namespace {

using namespace selftest;

constexpr int kYear = 2011;

Instant at(int jday, int hour, int minute, int second = 0) {
  return instant_from_julian_day(kYear, jday, hour, minute, second);
}

Sample sample(const Instant& t, double temperature_c) {
  Sample s;
  s.time = t;
  s.raw_count = 32000.0;
  s.resistance_ohm = 45000.0;
  s.temperature_c = temperature_c;
  return s;
}

Sample sample_at_offset(const Instant& base, std::int64_t seconds, double temperature_c) {
  return sample(Instant{base.unix_seconds + seconds}, temperature_c);
}

DeploymentWindow window(const std::string& dive, const Instant& from, const Instant& to, std::size_t row) {
  DeploymentWindow w;
  w.blanket_id = "A";
  w.dive_number = dive;
  w.deployed_at = from;
  w.recovered_at = to;
  w.source_path = "deployments.csv";
  w.source_row = row;
  return w;
}

OffsetTable offsets() {
  return OffsetTable({LoggerOffset{"0000101", 0.05}, LoggerOffset{"0000102", -0.03}});
}

InstrumentStream top_stream(std::vector<Sample> samples, const std::string& id = "0000101") {
  return InstrumentStream{id, "top.dat", std::move(samples)};
}

InstrumentStream bottom_stream(std::vector<Sample> samples, const std::string& id = "0000102") {
  return InstrumentStream{id, "bottom.dat", std::move(samples)};
}

void test_correction_and_differential() {
  const Instant t = at(45, 12, 0);
  const auto result = align_and_correct(top_stream({sample(t, 2.10)}),
                                        bottom_stream({sample(t, 2.08)}),
                                        offsets(),
                                        {window("1", at(45, 6, 0), at(46, 18, 0), 2)});

  expect_true(result.record_count() == 1, "one record windowed");
  const CorrectedRecord& r = result.groups.at(0).records.at(0);
  expect_near(r.top.corrected_c, 2.15, 1e-9, "top corrected = 2.10 + 0.05");
  expect_near(r.bottom.corrected_c, 2.05, 1e-9, "bottom corrected = 2.08 - 0.03");
  expect_near(r.differential_c, 0.10, 1e-9, "differential = top - bottom");
  expect_near(r.top.temperature_c, 2.10, 0.0, "raw temperature kept");
  expect_true(r.time == t, "record keeps the sample time");
  expect_near(result.top_offset_c, 0.05, 0.0, "top offset reported");
  expect_near(result.bottom_offset_c, -0.03, 0.0, "bottom offset reported");
}

void test_window_inclusion() {
  const Instant from = at(45, 6, 0);
  const Instant to = at(46, 18, 0);
  const std::vector<Instant> times = {
    Instant{from.unix_seconds - 30},  // before deployment
    from,                             // deployment instant
    at(45, 12, 0),
    to,                               // recovery instant
    at(47, 0, 0),                     // after recovery
  };

  std::vector<Sample> top;
  std::vector<Sample> bottom;
  for (const auto& t : times) {
    top.push_back(sample(t, 3.0));
    bottom.push_back(sample(t, 2.0));
  }

  const auto result = align_and_correct(top_stream(top), bottom_stream(bottom), offsets(),
                                        {window("1", from, to, 2)});
  const auto& recs = result.groups.at(0).records;
  expect_true(recs.size() == 3, "deployment, midpoint and recovery samples kept");
  expect_true(recs.front().time == from, "deployment endpoint included");
  expect_true(recs.back().time == to, "recovery endpoint included");
  expect_true(result.stats.outside_windows == 2, "samples outside the window discarded");

  bool has_day47 = false;
  for (const auto& r : recs) {
    if (r.time == at(47, 0, 0)) has_day47 = true;
  }
  expect_true(!has_day47, "day 47 00:00 excluded from a window ending day 46 18:00");
}

void test_overlapping_windows() {
  const std::vector<DeploymentWindow> touching = {
    window("1", at(45, 6, 0), at(46, 18, 0), 2),
    window("2", at(46, 18, 0), at(47, 6, 0), 3),
  };
  expect_throws<OverlappingWindowError>([&] { order_disjoint_windows(touching); },
                                        "windows sharing an endpoint overlap");

  const std::vector<DeploymentWindow> out_of_order = {
    window("2", at(46, 0, 0), at(47, 6, 0), 3),
    window("1", at(45, 6, 0), at(46, 18, 0), 2),
  };
  try {
    align_and_correct(top_stream({}), bottom_stream({}), offsets(), out_of_order);
    fail("overlap must be detected even with no samples");
  } catch (const OverlappingWindowError& e) {
    expect_true(e.where().row == 3, "overlap names the later-deployed row");
    expect_true(std::string(e.what()).find("row 2") != std::string::npos, "overlap names the other row");
  }

  const std::vector<DeploymentWindow> disjoint = {
    window("2", at(47, 0, 0), at(48, 0, 0), 3),
    window("1", at(45, 6, 0), at(46, 18, 0), 2),
  };
  const auto ordered = order_disjoint_windows(disjoint);
  expect_true(ordered.size() == 2 && ordered[0].dive_number == "1", "windows ordered by deployment");
  expect_true(find_window(ordered, at(45, 12, 0)) == 0, "find_window: first window");
  expect_true(find_window(ordered, at(47, 0, 0)) == 1, "find_window: second window start");
  expect_true(find_window(ordered, at(46, 20, 0)) == -1, "find_window: gap between windows");
  expect_true(find_window(ordered, at(44, 0, 0)) == -1, "find_window: before all windows");
}

void test_unknown_logger() {
  const Instant t = at(45, 12, 0);
  try {
    align_and_correct(top_stream({sample(t, 2.10)}, "0000999"),
                      bottom_stream({sample(t, 2.08)}),
                      offsets(),
                      {window("1", at(45, 6, 0), at(46, 18, 0), 2)});
    fail("unknown top logger must be rejected");
  } catch (const UnknownLoggerIdError& e) {
    expect_eq_str(e.logger_id(), "0000999", "unknown logger ID reported");
    expect_eq_str(e.where().path, "top.dat", "unknown logger file reported");
  }

  expect_throws<UnknownLoggerIdError>(
      [&] {
        align_and_correct(top_stream({}), bottom_stream({}, "0000998"), offsets(), {});
      },
      "unknown bottom logger rejected with no samples");
}

void test_pairing() {
  const Instant base = at(45, 12, 0);

  // Strict equality: one second apart never pairs.
  {
    const auto out = pair_by_timestamp({sample_at_offset(base, 0, 1.0), sample_at_offset(base, 30, 1.0)},
                                       {sample_at_offset(base, 1, 1.0), sample_at_offset(base, 30, 1.0)},
                                       PairingSettings{});
    expect_true(out.pairs.size() == 1, "default tolerance pairs exact timestamps only");
    expect_true(out.unmatched_top == 1 && out.unmatched_bottom == 1, "unpaired samples counted");
  }

  // Tolerance window.
  {
    PairingSettings tol;
    tol.tolerance_s = 5;
    const auto out = pair_by_timestamp(
        {sample_at_offset(base, 0, 1.0), sample_at_offset(base, 30, 1.0), sample_at_offset(base, 60, 1.0)},
        {sample_at_offset(base, 2, 1.0), sample_at_offset(base, 29, 1.0), sample_at_offset(base, 100, 1.0)},
        tol);
    expect_true(out.pairs.size() == 2, "two pairs within 5 s");
    expect_true(out.unmatched_top == 1 && out.unmatched_bottom == 1, "far samples left unpaired");
  }

  // Nearest neighbour wins.
  {
    PairingSettings tol;
    tol.tolerance_s = 5;
    const auto out = pair_by_timestamp({sample_at_offset(base, 0, 1.0)},
                                       {sample_at_offset(base, -4, 1.0), sample_at_offset(base, 1, 1.0)},
                                       tol);
    expect_true(out.pairs.size() == 1, "one pair");
    expect_true(!out.pairs.empty() && out.pairs[0].bottom.time.unix_seconds == base.unix_seconds + 1,
                "closest bottom sample chosen");
    expect_true(out.unmatched_bottom == 1, "further candidate dropped");
  }

  // Unsorted input.
  {
    const auto out = pair_by_timestamp({sample_at_offset(base, 60, 1.0), sample_at_offset(base, 0, 1.0)},
                                       {sample_at_offset(base, 0, 2.0), sample_at_offset(base, 60, 2.0)},
                                       PairingSettings{});
    expect_true(out.pairs.size() == 2, "input order does not matter");
    expect_true(out.pairs.size() == 2 && out.pairs[0].top.time < out.pairs[1].top.time, "pairs ascend in time");
  }

  PairingSettings bad;
  bad.tolerance_s = -1;
  expect_throws<ValidationError>([&] { pair_by_timestamp({}, {}, bad); }, "negative tolerance rejected");
}

void test_grouping() {
  std::vector<Sample> top;
  std::vector<Sample> bottom;
  // Day 48 first in file order to check sorting.
  top.push_back(sample(at(48, 12, 0), 5.0));
  bottom.push_back(sample(at(48, 12, 0), 4.0));
  top.push_back(sample(at(45, 12, 30), 3.0));
  bottom.push_back(sample(at(45, 12, 30), 2.0));
  top.push_back(sample(at(45, 12, 0), 3.0));
  bottom.push_back(sample(at(45, 12, 0), 2.0));

  const std::vector<DeploymentWindow> windows = {
    window("3", at(48, 0, 0), at(49, 0, 0), 4),
    window("2", at(47, 0, 0), at(47, 12, 0), 3),  // receives nothing
    window("1", at(45, 6, 0), at(46, 18, 0), 2),
  };

  const auto result = align_and_correct(top_stream(top), bottom_stream(bottom), offsets(), windows);
  expect_true(result.groups.size() == 3, "empty window kept in the result");
  expect_eq_str(result.groups[0].window.dive_number, "1", "groups ordered by deployment (1)");
  expect_eq_str(result.groups[1].window.dive_number, "2", "groups ordered by deployment (2)");
  expect_true(result.groups[1].records.empty(), "window without samples is empty");
  expect_true(result.groups[0].records.size() == 2 &&
                  result.groups[0].records[0].time < result.groups[0].records[1].time,
              "records ascend within a window");
  expect_true(result.groups[2].records.size() == 1, "last window receives its sample");
  expect_true(result.record_count() == 3, "record count sums all windows");
  expect_true(result.stats.paired == 3 && result.stats.outside_windows == 0, "stats");
}

} // namespace
} // namespace blanket

int main() {
  using namespace blanket;
  set_log_level(LogLevel::ERROR);

  test_correction_and_differential();
  test_window_inclusion();
  test_overlapping_windows();
  test_unknown_logger();
  test_pairing();
  test_grouping();

  return selftest::finish();
}
