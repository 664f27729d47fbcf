// Repository: Segweave
// Component: Timeline Reconstructor
// Purpose: Resolve gaps and overlaps among probed segments into a contiguous
//          slot list covering [0, total_duration).
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_TIMELINE_TIMELINE_RECONSTRUCTOR_HPP_
#define SEGWEAVE_TIMELINE_TIMELINE_RECONSTRUCTOR_HPP_

#include <string>
#include <vector>

#include "segweave/manifest/SegmentTypes.hpp"
#include "segweave/timeline/TimelineTypes.hpp"

namespace segweave::timeline {

// =============================================================================
// Timeline Reconstructor
// =============================================================================
//
// Run once per channel (video subset, audio subset). Deterministic: the
// result depends only on the segment list contents, never on fetch order.
//
// Algorithm:
//   1. Stable sort by (start_offset_s, manifest_index).
//   2. Walk with cursor = 0. Segments starting at/after total, or with a
//      probed duration <= epsilon, are discarded.
//   3. A gap before a segment becomes a filler slot.
//   4. A segment starting before the cursor is clamped to the cursor (the
//      segment placed first keeps the overlapping range); one that ends at
//      or before the cursor is discarded as fully shadowed.
//   5. Content end is min(start + duration, total).
//   6. A trailing gap becomes a final filler slot.
//
// Discards and clamps are reported as warnings; they never fail the call.
class TimelineReconstructor {
 public:
  struct ReconstructResult {
    bool valid;
    SessionError error;
    std::string detail;
    SlotList slots;
    std::vector<std::string> warnings;

    static ReconstructResult Success(SlotList s, std::vector<std::string> w) {
      return {true, SessionError::kNone, "", std::move(s), std::move(w)};
    }

    static ReconstructResult Failure(SessionError err, const std::string& detail = "") {
      return {false, err, detail, {}, {}};
    }
  };

  // channel is used for log lines only ("VIDEO" / "AUDIO").
  static ReconstructResult Reconstruct(std::vector<FetchedSegment> segments,
                                       double total_duration_s,
                                       const char* channel = "");

  struct ValidationResult {
    bool valid;
    std::string detail;

    static ValidationResult Success() { return {true, ""}; }
    static ValidationResult Failure(const std::string& detail) { return {false, detail}; }
  };

  // Contiguity check: non-empty, slot[0].start == 0, slot[i].end ==
  // slot[i+1].start, slot[last].end == total, every slot longer than
  // epsilon, content slots carry a segment. All comparisons within epsilon.
  static ValidationResult ValidateTimeline(const SlotList& slots, double total_duration_s);
};

}  // namespace segweave::timeline

#endif  // SEGWEAVE_TIMELINE_TIMELINE_RECONSTRUCTOR_HPP_
