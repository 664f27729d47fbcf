// Repository: Segweave
// Component: Session State Machine
// Purpose: Legal phase transitions for one session, with transition counts
//          for diagnostics.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_SESSION_SESSION_STATE_MACHINE_HPP_
#define SEGWEAVE_SESSION_SESSION_STATE_MACHINE_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

#include "segweave/session/SessionTypes.hpp"

namespace segweave::session {

class SessionStateMachine {
 public:
  using TransitionFn = std::function<void(SessionPhase from, SessionPhase to)>;

  struct Snapshot {
    SessionPhase phase = SessionPhase::kIdle;
    SessionPhase failed_from = SessionPhase::kIdle;
    std::map<std::pair<SessionPhase, SessionPhase>, uint64_t> transitions;
    uint64_t illegal_transition_total = 0;
  };

  SessionStateMachine() = default;

  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  // Forward transition along the pipeline. Returns false (and records an
  // illegal transition) for anything else, including leaving a terminal
  // phase.
  bool Advance(SessionPhase to);

  // Any non-terminal phase → Failed. Returns false when already terminal.
  bool Fail();

  // Invoked after every successful transition, outside the lock.
  void SetTransitionCallback(TransitionFn fn);

  [[nodiscard]] SessionPhase phase() const;
  [[nodiscard]] SessionPhase failed_from() const;
  [[nodiscard]] Snapshot GetSnapshot() const;

  static bool IsTerminal(SessionPhase phase) {
    return phase == SessionPhase::kDone || phase == SessionPhase::kFailed;
  }

  static bool IsLegalAdvance(SessionPhase from, SessionPhase to);

 private:
  void RecordIllegalTransitionLocked(SessionPhase from, SessionPhase attempted_to);

  mutable std::mutex mutex_;
  SessionPhase phase_ = SessionPhase::kIdle;
  SessionPhase failed_from_ = SessionPhase::kIdle;
  std::map<std::pair<SessionPhase, SessionPhase>, uint64_t> transitions_;
  uint64_t illegal_transition_total_ = 0;
  TransitionFn on_transition_;
};

}  // namespace segweave::session

#endif  // SEGWEAVE_SESSION_SESSION_STATE_MACHINE_HPP_
