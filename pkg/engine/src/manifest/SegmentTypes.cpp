// Repository: Segweave
// Component: Segment Types Implementation
// Copyright (c) 2025 Segweave

#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave {

// New error codes may be added; existing codes must not change meaning.
const char* SessionErrorToString(SessionError error) {
  switch (error) {
    case SessionError::kNone:
      return "NONE";
    case SessionError::kInvalidManifest:
      return "INVALID_MANIFEST";
    case SessionError::kManifestUnavailable:
      return "MANIFEST_UNAVAILABLE";
    case SessionError::kFetchError:
      return "FETCH_ERROR";
    case SessionError::kProbeError:
      return "PROBE_ERROR";
    case SessionError::kNoContent:
      return "NO_CONTENT";
    case SessionError::kCompileError:
      return "COMPILE_ERROR";
    case SessionError::kCancelled:
      return "CANCELLED";
    case SessionError::kIoError:
      return "IO_ERROR";
  }
  return "UNKNOWN_ERROR";
}

}  // namespace segweave
