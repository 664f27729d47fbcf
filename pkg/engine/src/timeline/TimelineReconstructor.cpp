// Repository: Segweave
// Component: Timeline Reconstructor Implementation
// Copyright (c) 2025 Segweave

#include "segweave/timeline/TimelineReconstructor.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "segweave/util/Logger.hpp"

namespace segweave::timeline {

using segweave::util::Logger;

namespace {

std::string Describe(const FetchedSegment& s) {
  std::ostringstream oss;
  oss << "file=" << s.ref.cache_filename
      << " index=" << s.ref.manifest_index
      << " start_s=" << s.ref.start_offset_s
      << " duration_s=" << s.probed_duration_s;
  return oss.str();
}

}  // namespace

// =============================================================================
// Reconstruct
// =============================================================================

TimelineReconstructor::ReconstructResult TimelineReconstructor::Reconstruct(
    std::vector<FetchedSegment> segments,
    double total_duration_s,
    const char* channel) {
  if (!std::isfinite(total_duration_s) || total_duration_s <= kTimelineEpsilon) {
    std::ostringstream oss;
    oss << "total duration must be > 0 (got " << total_duration_s << ")";
    return ReconstructResult::Failure(SessionError::kInvalidManifest, oss.str());
  }

  std::stable_sort(segments.begin(), segments.end(),
                   [](const FetchedSegment& a, const FetchedSegment& b) {
                     if (a.ref.start_offset_s != b.ref.start_offset_s) {
                       return a.ref.start_offset_s < b.ref.start_offset_s;
                     }
                     return a.ref.manifest_index < b.ref.manifest_index;
                   });

  SlotList slots;
  std::vector<std::string> warnings;
  const std::string tag = std::string("[TimelineReconstructor] channel=") + channel + " ";

  auto warn = [&](const std::string& event, const FetchedSegment& s) {
    std::string line = event + " " + Describe(s);
    Logger::Warn(tag + line);
    warnings.push_back(std::move(line));
  };

  double cursor = 0.0;

  for (auto& seg : segments) {
    const double start = seg.ref.start_offset_s;
    const double duration = seg.probed_duration_s;

    if (start >= total_duration_s - kTimelineEpsilon) {
      warn("DISCARD_PAST_END", seg);
      continue;
    }
    if (!(duration > kTimelineEpsilon)) {
      warn("DISCARD_ZERO_DURATION", seg);
      continue;
    }

    const double raw_end = start + duration;
    const double end = std::min(raw_end, total_duration_s);
    double effective_start = start;

    if (start > cursor + kTimelineEpsilon) {
      slots.push_back(TimelineSlot::Filler(cursor, start));
      cursor = start;
    } else if (start < cursor - kTimelineEpsilon) {
      if (raw_end <= cursor + kTimelineEpsilon) {
        warn("DISCARD_SHADOWED", seg);
        continue;
      }
      std::ostringstream oss;
      oss << "CLAMP_OVERLAP " << Describe(seg) << " clamped_start_s=" << cursor;
      Logger::Info(tag + oss.str());
      warnings.push_back(oss.str());
      effective_start = cursor;
    } else {
      // Within epsilon of the cursor: snap so slots stay exactly contiguous.
      effective_start = cursor;
    }

    if (end - effective_start <= kTimelineEpsilon) {
      warn("DISCARD_EMPTY_AFTER_CLAMP", seg);
      continue;
    }

    const double source_offset = std::max(0.0, effective_start - start);
    slots.push_back(TimelineSlot::Content(effective_start, end, std::move(seg), source_offset));
    cursor = end;
  }

  if (total_duration_s - cursor > kTimelineEpsilon) {
    slots.push_back(TimelineSlot::Filler(cursor, total_duration_s));
  } else if (!slots.empty()) {
    slots.back().end_s = total_duration_s;
  }

  if (slots.empty()) {
    slots.push_back(TimelineSlot::Filler(0.0, total_duration_s));
  }

  if (Logger::DebugEnabled()) {
    size_t content = 0;
    for (const auto& s : slots) {
      if (s.is_content()) ++content;
    }
    std::ostringstream oss;
    oss << tag << "RECONSTRUCTED slots=" << slots.size()
        << " content=" << content
        << " filler=" << (slots.size() - content)
        << " warnings=" << warnings.size()
        << " total_s=" << total_duration_s;
    Logger::Debug(oss.str());
  }

  return ReconstructResult::Success(std::move(slots), std::move(warnings));
}

// =============================================================================
// ValidateTimeline
// =============================================================================

TimelineReconstructor::ValidationResult TimelineReconstructor::ValidateTimeline(
    const SlotList& slots, double total_duration_s) {
  if (slots.empty()) {
    return ValidationResult::Failure("timeline has no slots");
  }
  if (std::fabs(slots.front().start_s) > kTimelineEpsilon) {
    std::ostringstream oss;
    oss << "first slot starts at " << slots.front().start_s << ", expected 0";
    return ValidationResult::Failure(oss.str());
  }

  for (size_t i = 0; i < slots.size(); ++i) {
    const TimelineSlot& s = slots[i];
    if (s.end_s - s.start_s <= kTimelineEpsilon) {
      std::ostringstream oss;
      oss << "slot " << i << " is empty [" << s.start_s << ", " << s.end_s << ")";
      return ValidationResult::Failure(oss.str());
    }
    if (s.is_content() && !s.segment) {
      std::ostringstream oss;
      oss << "content slot " << i << " has no segment";
      return ValidationResult::Failure(oss.str());
    }
    if (i + 1 < slots.size() &&
        std::fabs(s.end_s - slots[i + 1].start_s) > kTimelineEpsilon) {
      std::ostringstream oss;
      oss << "gap or overlap between slot " << i << " (end " << s.end_s
          << ") and slot " << (i + 1) << " (start " << slots[i + 1].start_s << ")";
      return ValidationResult::Failure(oss.str());
    }
  }

  if (std::fabs(slots.back().end_s - total_duration_s) > kTimelineEpsilon) {
    std::ostringstream oss;
    oss << "last slot ends at " << slots.back().end_s
        << ", expected " << total_duration_s;
    return ValidationResult::Failure(oss.str());
  }
  return ValidationResult::Success();
}

}  // namespace segweave::timeline
