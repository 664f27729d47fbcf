// Repository: Segweave
// Component: Track Compiler Interface
// Purpose: Narrow adapter between reconstructed timelines and the media
//          backend that renders them into one output file.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_COMPILE_TRACK_COMPILER_HPP_
#define SEGWEAVE_COMPILE_TRACK_COMPILER_HPP_

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "segweave/manifest/SegmentTypes.hpp"
#include "segweave/timeline/TimelineTypes.hpp"

namespace segweave::compile {

struct CompileRequest {
  timeline::SlotList video_slots;
  timeline::SlotList audio_slots;
  double total_duration_s = 0.0;

  // Output is cut to this length from the start when it is shorter than
  // total_duration_s.
  std::optional<double> truncate_at_s;

  std::string output_path;

  double OutputDuration() const {
    if (truncate_at_s && *truncate_at_s > 0.0 && *truncate_at_s < total_duration_s) {
      return *truncate_at_s;
    }
    return total_duration_s;
  }
};

struct CompileResult {
  bool ok;
  SessionError error;  // kCompileError or kCancelled on failure
  std::string detail;
  std::string output_path;
  int64_t output_bytes;

  static CompileResult Success(const std::string& path, int64_t bytes) {
    return {true, SessionError::kNone, "", path, bytes};
  }

  static CompileResult Failure(SessionError err, const std::string& detail) {
    return {false, err, detail, "", 0};
  }
};

// ITrackCompiler consumes slot lists in order and never reorders them.
// Implementations must not leave a partially written file at output_path
// on failure or cancellation. cancel may be null.
class ITrackCompiler {
 public:
  virtual ~ITrackCompiler() = default;

  virtual CompileResult Compile(const CompileRequest& request,
                                const std::atomic<bool>* cancel) = 0;
};

}  // namespace segweave::compile

#endif  // SEGWEAVE_COMPILE_TRACK_COMPILER_HPP_
