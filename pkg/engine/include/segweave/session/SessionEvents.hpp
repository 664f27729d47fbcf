// Repository: Segweave
// Component: Session Events
// Purpose: Structured events emitted by the session orchestrator, and the
//          explicit context object that carries config, sink and cancel flag.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_SESSION_SESSION_EVENTS_HPP_
#define SEGWEAVE_SESSION_SESSION_EVENTS_HPP_

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "segweave/manifest/SegmentTypes.hpp"
#include "segweave/session/SessionTypes.hpp"

namespace segweave::session {

// Payload structs. Times are seconds on the session timeline.
struct SegmentFetchedPayload {
  std::string filename;
  int32_t manifest_index = 0;
  MediaKind kind = MediaKind::kUnknown;
  double duration_s = 0.0;
  bool from_cache = false;
};

struct SegmentLostPayload {
  std::string filename;
  int32_t manifest_index = 0;
  SessionError error = SessionError::kNone;  // kFetchError or kProbeError
  std::string detail;
};

struct FetchProgressPayload {
  std::string filename;
  int64_t bytes = 0;
  std::optional<int64_t> total;  // Unset: indeterminate
};

struct TimelineBuiltPayload {
  MediaKind channel = MediaKind::kUnknown;
  int32_t content_slots = 0;
  int32_t filler_slots = 0;
  int32_t warnings = 0;
};

// ISessionEventSink
//
// OnSegmentFetched / OnSegmentLost / OnFetchProgress are called from fetch
// worker threads; implementations must be thread-safe. Everything else is
// called on the orchestrator thread.
class ISessionEventSink {
 public:
  virtual ~ISessionEventSink() = default;

  virtual void OnPhaseChanged(SessionPhase from, SessionPhase to) = 0;
  virtual void OnSegmentFetched(const SegmentFetchedPayload& p) = 0;
  virtual void OnSegmentLost(const SegmentLostPayload& p) = 0;
  virtual void OnFetchProgress(const FetchProgressPayload& p) = 0;
  virtual void OnTimelineBuilt(const TimelineBuiltPayload& p) = 0;
  virtual void OnSessionFinished(const SessionReport& report) = 0;
};

// Renders events as log lines through util::Logger. Progress lines go to
// Debug so they do not flood the console.
class LoggerEventSink : public ISessionEventSink {
 public:
  void OnPhaseChanged(SessionPhase from, SessionPhase to) override;
  void OnSegmentFetched(const SegmentFetchedPayload& p) override;
  void OnSegmentLost(const SegmentLostPayload& p) override;
  void OnFetchProgress(const FetchProgressPayload& p) override;
  void OnTimelineBuilt(const TimelineBuiltPayload& p) override;
  void OnSessionFinished(const SessionReport& report) override;
};

// Per-session context, passed explicitly instead of process-wide state.
// cancel may be null (not cancellable).
struct SessionContext {
  SessionConfig config;
  ISessionEventSink& events;
  const std::atomic<bool>* cancel = nullptr;

  bool Cancelled() const {
    return cancel && cancel->load(std::memory_order_acquire);
  }
};

}  // namespace segweave::session

#endif  // SEGWEAVE_SESSION_SESSION_EVENTS_HPP_
