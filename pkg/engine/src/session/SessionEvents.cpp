// Repository: Segweave
// Component: Logger Event Sink
// Copyright (c) 2025 Segweave

#include "segweave/session/SessionEvents.hpp"

#include <sstream>

#include "segweave/util/Logger.hpp"

namespace segweave::session {

using segweave::util::Logger;

void LoggerEventSink::OnPhaseChanged(SessionPhase from, SessionPhase to) {
  std::ostringstream oss;
  oss << "[Session] PHASE " << SessionPhaseToString(from) << " -> " << SessionPhaseToString(to);
  Logger::Info(oss.str());
}

void LoggerEventSink::OnSegmentFetched(const SegmentFetchedPayload& p) {
  std::ostringstream oss;
  oss << "[Session] SEGMENT_READY file=" << p.filename
      << " index=" << p.manifest_index
      << " kind=" << MediaKindName(p.kind)
      << " duration_s=" << p.duration_s
      << " source=" << (p.from_cache ? "cache" : "network");
  Logger::Info(oss.str());
}

void LoggerEventSink::OnSegmentLost(const SegmentLostPayload& p) {
  std::ostringstream oss;
  oss << "[Session] SEGMENT_LOST file=" << p.filename
      << " index=" << p.manifest_index
      << " error=" << SessionErrorToString(p.error)
      << " detail=" << p.detail;
  Logger::Warn(oss.str());
}

void LoggerEventSink::OnFetchProgress(const FetchProgressPayload& p) {
  if (!Logger::DebugEnabled()) return;
  std::ostringstream oss;
  oss << "[Session] FETCH_PROGRESS file=" << p.filename << " bytes=" << p.bytes;
  if (p.total && *p.total > 0) {
    oss << "/" << *p.total << " pct=" << (100 * p.bytes / *p.total);
  } else {
    oss << " total=unknown";
  }
  Logger::Debug(oss.str());
}

void LoggerEventSink::OnTimelineBuilt(const TimelineBuiltPayload& p) {
  std::ostringstream oss;
  oss << "[Session] TIMELINE channel=" << MediaKindName(p.channel)
      << " content=" << p.content_slots
      << " filler=" << p.filler_slots
      << " warnings=" << p.warnings;
  Logger::Info(oss.str());
}

void LoggerEventSink::OnSessionFinished(const SessionReport& r) {
  std::ostringstream oss;
  if (r.ok) {
    oss << "[Session] DONE output=" << r.output_path
        << " bytes=" << r.output_bytes
        << " segments=" << (r.segments_total - r.segments_lost()) << "/" << r.segments_total
        << " deleted_cache_files=" << r.deleted_cache_files;
    Logger::Info(oss.str());
    return;
  }
  oss << "[Session] FAILED phase=" << SessionPhaseToString(r.failed_phase)
      << " error=" << SessionErrorToString(r.error)
      << " lost=" << r.segments_lost() << "/" << r.segments_total
      << " (fetch=" << r.fetch_failures << " probe=" << r.probe_failures << ")"
      << " detail=" << r.detail;
  Logger::Error(oss.str());
  for (const auto& cause : r.cause_chain) {
    Logger::Error("[Session]   caused by: " + cause);
  }
}

}  // namespace segweave::session
