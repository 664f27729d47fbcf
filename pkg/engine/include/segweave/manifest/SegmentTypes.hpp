// Repository: Segweave
// Component: Segment Types
// Purpose: Data structures shared by the manifest, fetch, timeline and
//          session layers.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_MANIFEST_SEGMENT_TYPES_HPP_
#define SEGWEAVE_MANIFEST_SEGMENT_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace segweave {

// =============================================================================
// Error Codes
// =============================================================================

enum class SessionError {
  // No error
  kNone = 0,

  // Manifest duration absent or <= 0, or document unusable. Fatal, raised
  // before any fetch.
  kInvalidManifest,

  // Manifest endpoint unreachable, non-2xx, access denied or not JSON.
  kManifestUnavailable,

  // Per-segment network or file I/O failure. Recovered by exclusion.
  kFetchError,

  // Segment unreadable as video or audio. Recovered by exclusion.
  kProbeError,

  // Zero usable segments across both channels after fetch + probe.
  kNoContent,

  // Track compiler failed. Cache is preserved for retry.
  kCompileError,

  // User-initiated abort.
  kCancelled,

  // Cache directory could not be created or written.
  kIoError,
};

// Convert error code to string for logging and reports.
const char* SessionErrorToString(SessionError error);

// =============================================================================
// Media Kind
// =============================================================================

enum class MediaKind : int32_t {
  kUnknown = 0,
  kVideo   = 1,
  kAudio   = 2,
};

inline const char* MediaKindName(MediaKind k) {
  switch (k) {
    case MediaKind::kVideo:   return "VIDEO";
    case MediaKind::kAudio:   return "AUDIO";
    case MediaKind::kUnknown: return "UNKNOWN";
  }
  return "UNKNOWN";
}

// =============================================================================
// SegmentRef
// One manifest entry with a resolvable url. Immutable after normalization.
// =============================================================================

struct SegmentRef {
  std::string url;
  double start_offset_s = 0.0;       // >= 0
  MediaKind kind_hint = MediaKind::kUnknown;

  // Position among accepted manifest entries; tie-break for equal offsets.
  int32_t manifest_index = 0;

  // Cache key: URL basename, or segment_<md5 prefix>.mp4.
  std::string cache_filename;
};

// =============================================================================
// FetchedSegment
// A SegmentRef whose file exists locally and was probed successfully.
// probed_kind is authoritative over ref.kind_hint.
// =============================================================================

struct FetchedSegment {
  SegmentRef ref;
  std::string local_path;
  double probed_duration_s = 0.0;
  MediaKind probed_kind = MediaKind::kUnknown;

  // Video segment with its own decodable audio stream.
  bool has_embedded_audio = false;
};

}  // namespace segweave

#endif  // SEGWEAVE_MANIFEST_SEGMENT_TYPES_HPP_
