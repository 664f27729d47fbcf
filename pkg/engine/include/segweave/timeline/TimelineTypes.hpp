// Repository: Segweave
// Component: Timeline Types
// Purpose: Slot records produced by the timeline reconstructor and consumed
//          by track compilers.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_TIMELINE_TIMELINE_TYPES_HPP_
#define SEGWEAVE_TIMELINE_TIMELINE_TYPES_HPP_

#include <optional>
#include <vector>

#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave::timeline {

// Comparison tolerance (seconds) for every boundary decision.
constexpr double kTimelineEpsilon = 1e-6;

enum class SlotType {
  kContent,
  kFiller,
};

inline const char* SlotTypeName(SlotType t) {
  switch (t) {
    case SlotType::kContent: return "CONTENT";
    case SlotType::kFiller:  return "FILLER";
  }
  return "UNKNOWN";
}

// =============================================================================
// TimelineSlot
// [start_s, end_s) on the output timeline. For content slots, media is read
// from segment->local_path starting at source_offset_s.
// =============================================================================

struct TimelineSlot {
  SlotType type = SlotType::kFiller;
  double start_s = 0.0;
  double end_s = 0.0;

  // Set for kContent only.
  std::optional<FetchedSegment> segment;

  // Seconds into the segment media where this slot begins. Non-zero when an
  // overlapping prefix was truncated.
  double source_offset_s = 0.0;

  double duration_s() const { return end_s - start_s; }
  bool is_content() const { return type == SlotType::kContent; }

  static TimelineSlot Filler(double start_s, double end_s) {
    TimelineSlot slot;
    slot.type = SlotType::kFiller;
    slot.start_s = start_s;
    slot.end_s = end_s;
    return slot;
  }

  static TimelineSlot Content(double start_s, double end_s,
                              FetchedSegment seg, double source_offset_s) {
    TimelineSlot slot;
    slot.type = SlotType::kContent;
    slot.start_s = start_s;
    slot.end_s = end_s;
    slot.segment = std::move(seg);
    slot.source_offset_s = source_offset_s;
    return slot;
  }
};

using SlotList = std::vector<TimelineSlot>;

}  // namespace segweave::timeline

#endif  // SEGWEAVE_TIMELINE_TIMELINE_TYPES_HPP_
