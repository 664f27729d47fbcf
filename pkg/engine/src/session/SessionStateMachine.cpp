// Repository: Segweave
// Component: Session State Machine Implementation
// Copyright (c) 2025 Segweave

#include "segweave/session/SessionStateMachine.hpp"

#include "segweave/util/Logger.hpp"

namespace segweave::session {

using segweave::util::Logger;

const char* SessionPhaseToString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::kIdle:           return "IDLE";
    case SessionPhase::kFetching:       return "FETCHING";
    case SessionPhase::kReconstructing: return "RECONSTRUCTING";
    case SessionPhase::kCompiling:      return "COMPILING";
    case SessionPhase::kCleaningUp:     return "CLEANING_UP";
    case SessionPhase::kDone:           return "DONE";
    case SessionPhase::kFailed:         return "FAILED";
  }
  return "UNKNOWN";
}

bool SessionStateMachine::IsLegalAdvance(SessionPhase from, SessionPhase to) {
  switch (from) {
    case SessionPhase::kIdle:           return to == SessionPhase::kFetching;
    case SessionPhase::kFetching:       return to == SessionPhase::kReconstructing;
    case SessionPhase::kReconstructing: return to == SessionPhase::kCompiling;
    case SessionPhase::kCompiling:      return to == SessionPhase::kCleaningUp;
    case SessionPhase::kCleaningUp:     return to == SessionPhase::kDone;
    case SessionPhase::kDone:
    case SessionPhase::kFailed:
      return false;
  }
  return false;
}

bool SessionStateMachine::Advance(SessionPhase to) {
  SessionPhase from;
  TransitionFn callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = phase_;
    if (!IsLegalAdvance(from, to)) {
      RecordIllegalTransitionLocked(from, to);
      return false;
    }
    phase_ = to;
    transitions_[{from, to}]++;
    callback = on_transition_;
  }
  if (callback) callback(from, to);
  return true;
}

bool SessionStateMachine::Fail() {
  SessionPhase from;
  TransitionFn callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = phase_;
    if (IsTerminal(from)) {
      RecordIllegalTransitionLocked(from, SessionPhase::kFailed);
      return false;
    }
    failed_from_ = from;
    phase_ = SessionPhase::kFailed;
    transitions_[{from, SessionPhase::kFailed}]++;
    callback = on_transition_;
  }
  if (callback) callback(from, SessionPhase::kFailed);
  return true;
}

void SessionStateMachine::SetTransitionCallback(TransitionFn fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_transition_ = std::move(fn);
}

SessionPhase SessionStateMachine::phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_;
}

SessionPhase SessionStateMachine::failed_from() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_from_;
}

SessionStateMachine::Snapshot SessionStateMachine::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  snap.phase = phase_;
  snap.failed_from = failed_from_;
  snap.transitions = transitions_;
  snap.illegal_transition_total = illegal_transition_total_;
  return snap;
}

void SessionStateMachine::RecordIllegalTransitionLocked(SessionPhase from,
                                                        SessionPhase attempted_to) {
  ++illegal_transition_total_;
  transitions_[{from, attempted_to}]++;
  Logger::Warn(std::string("[SessionStateMachine] ILLEGAL_TRANSITION from=") +
               SessionPhaseToString(from) + " to=" + SessionPhaseToString(attempted_to));
}

}  // namespace segweave::session
