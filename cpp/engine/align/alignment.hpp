#pragma once
/*
================================================================================
Align: Offset Correction, Top/Bottom Pairing, Deployment Windowing
FILE: cpp/engine/align/alignment.hpp

Purpose:
  - Turn the two raw logger streams of one blanket into offset-corrected,
    paired, windowed records:
      1) resolve each logger's offset (UnknownLoggerIdError if absent)
      2) corrected = raw + offset, per sample
      3) pair top/bottom samples by timestamp (nearest neighbour within
         PairingSettings::tolerance_s; 0 = exact match)
      4) assign pairs to the deployment window containing them (closed
         interval); pairs outside every window are dropped
      5) differential = top corrected - bottom corrected

Contract:
  - Pure: no I/O, no hidden state. Inputs are read-only.
  - Unpaired samples are counted and reported, never fatal.
  - Overlapping windows are fatal (OverlappingWindowError), checked up front.
  - Output groups follow deployed_at order; records ascend in time.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/io/antares_dat.hpp"
#include "engine/io/deployment_table.hpp"
#include "engine/io/offset_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace blanket {

// One logger's samples plus what identifies it.
struct InstrumentStream {
  std::string logger_id;
  std::string source_path;
  std::vector<Sample> samples;
};

struct ChannelReading {
  double raw_count = 0.0;
  double resistance_ohm = 0.0;
  double temperature_c = 0.0;
  double corrected_c = 0.0;
};

struct CorrectedRecord {
  Instant time{};
  ChannelReading top{};
  ChannelReading bottom{};
  double differential_c = 0.0;
};

struct WindowGroup {
  DeploymentWindow window;
  std::vector<CorrectedRecord> records;
};

struct AlignmentStats {
  std::size_t top_samples = 0;
  std::size_t bottom_samples = 0;
  std::size_t paired = 0;
  std::size_t unmatched_top = 0;
  std::size_t unmatched_bottom = 0;
  std::size_t outside_windows = 0;
  std::size_t windowed = 0;
};

struct AlignmentResult {
  std::string top_logger_id;
  std::string bottom_logger_id;
  double top_offset_c = 0.0;
  double bottom_offset_c = 0.0;

  std::vector<WindowGroup> groups;
  AlignmentStats stats;

  std::size_t record_count() const noexcept { return stats.windowed; }
};

// A top sample and a bottom sample judged to be simultaneous.
struct SamplePair {
  Sample top;
  Sample bottom;
};

struct PairingOutcome {
  std::vector<SamplePair> pairs;
  std::size_t unmatched_top = 0;
  std::size_t unmatched_bottom = 0;
};

// Step 3. Inputs need not be sorted; both are stably sorted by time first.
PairingOutcome pair_by_timestamp(std::vector<Sample> top,
                                 std::vector<Sample> bottom,
                                 const PairingSettings& settings);

// Returns windows ordered by deployed_at. Throws OverlappingWindowError
// naming both rows when two closed intervals intersect.
std::vector<DeploymentWindow> order_disjoint_windows(const std::vector<DeploymentWindow>& windows);

// Index into `ordered` (from order_disjoint_windows) of the window holding t,
// or -1 when none does.
long find_window(const std::vector<DeploymentWindow>& ordered, const Instant& t) noexcept;

// Steps 1 to 5.
AlignmentResult align_and_correct(const InstrumentStream& top,
                                  const InstrumentStream& bottom,
                                  const OffsetTable& offsets,
                                  const std::vector<DeploymentWindow>& windows,
                                  const PairingSettings& settings = PairingSettings{});

} // namespace blanket
