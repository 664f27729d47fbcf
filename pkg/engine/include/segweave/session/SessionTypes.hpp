// Repository: Segweave
// Component: Session Types
// Purpose: Phases, configuration and the final report of one reconstruction
//          session.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_SESSION_SESSION_TYPES_HPP_
#define SEGWEAVE_SESSION_SESSION_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave::session {

// =============================================================================
// Session Phase
// =============================================================================
//
//   Idle → Fetching → Reconstructing → Compiling → CleaningUp → Done
//     └───────┴────────────┴───────────────┴────────────┴──→ Failed
//
// Done and Failed are terminal. Idle covers manifest normalization.
enum class SessionPhase {
  kIdle = 0,
  kFetching = 1,
  kReconstructing = 2,
  kCompiling = 3,
  kCleaningUp = 4,
  kDone = 5,
  kFailed = 6,
};

const char* SessionPhaseToString(SessionPhase phase);

// =============================================================================
// Session Config
// =============================================================================

struct SessionConfig {
  std::string output_dir = "downloads";
  std::string session_token;            // Sent as cookie sessionId; empty = none
  std::optional<double> max_duration_s; // Output truncation
  bool keep_files = false;              // Skip CleaningUp deletions
  bool debug = false;                   // debug_data.json on NoContent
  bool quiet = false;
  int worker_count = 4;
};

// =============================================================================
// Session Report
// =============================================================================

struct SessionReport {
  bool ok = false;
  SessionPhase phase = SessionPhase::kIdle;         // Phase reached (Done / Failed)
  SessionPhase failed_phase = SessionPhase::kIdle;  // Meaningful when !ok
  SessionError error = SessionError::kNone;
  std::string detail;

  // Originating failure first, session-level summary last.
  std::vector<std::string> cause_chain;

  std::string session_name;
  std::string cache_dir;

  int32_t segments_total = 0;        // Accepted manifest entries
  int32_t skipped_entries = 0;       // Rejected manifest entries
  int32_t fetch_failures = 0;
  int32_t probe_failures = 0;
  int32_t video_segments = 0;
  int32_t audio_segments = 0;
  bool audio_from_video = false;     // Audio channel taken from video segments
  int32_t network_fetches = 0;       // Cache misses that hit the network
  int32_t timeline_warnings = 0;

  std::string output_path;
  int64_t output_bytes = 0;
  int32_t deleted_cache_files = 0;

  int32_t segments_lost() const { return fetch_failures + probe_failures; }
};

}  // namespace segweave::session

#endif  // SEGWEAVE_SESSION_SESSION_TYPES_HPP_
