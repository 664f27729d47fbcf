// ISessionEventSink that stores every event. Thread-safe; fetch events
// arrive from worker threads.

#ifndef SEGWEAVE_TESTS_FIXTURES_RECORDING_EVENT_SINK_H_
#define SEGWEAVE_TESTS_FIXTURES_RECORDING_EVENT_SINK_H_

#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "segweave/session/SessionEvents.hpp"

namespace segweave::tests::fixtures {

class RecordingEventSink : public segweave::session::ISessionEventSink {
 public:
  using SessionPhase = segweave::session::SessionPhase;

  void OnPhaseChanged(SessionPhase from, SessionPhase to) override {
    std::lock_guard<std::mutex> lock(mutex_);
    phases_.emplace_back(from, to);
  }

  void OnSegmentFetched(const segweave::session::SegmentFetchedPayload& p) override {
    std::lock_guard<std::mutex> lock(mutex_);
    fetched_.push_back(p);
  }

  void OnSegmentLost(const segweave::session::SegmentLostPayload& p) override {
    std::lock_guard<std::mutex> lock(mutex_);
    lost_.push_back(p);
  }

  void OnFetchProgress(const segweave::session::FetchProgressPayload& p) override {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.push_back(p);
  }

  void OnTimelineBuilt(const segweave::session::TimelineBuiltPayload& p) override {
    std::lock_guard<std::mutex> lock(mutex_);
    timelines_.push_back(p);
  }

  void OnSessionFinished(const segweave::session::SessionReport& report) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++finished_count_;
    final_report_ = report;
  }

  std::vector<std::pair<SessionPhase, SessionPhase>> phases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phases_;
  }
  std::vector<segweave::session::SegmentFetchedPayload> fetched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetched_;
  }
  std::vector<segweave::session::SegmentLostPayload> lost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lost_;
  }
  std::vector<segweave::session::FetchProgressPayload> progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
  }
  std::vector<segweave::session::TimelineBuiltPayload> timelines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timelines_;
  }
  int finished_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_count_;
  }
  std::optional<segweave::session::SessionReport> final_report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return final_report_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<SessionPhase, SessionPhase>> phases_;
  std::vector<segweave::session::SegmentFetchedPayload> fetched_;
  std::vector<segweave::session::SegmentLostPayload> lost_;
  std::vector<segweave::session::FetchProgressPayload> progress_;
  std::vector<segweave::session::TimelineBuiltPayload> timelines_;
  int finished_count_ = 0;
  std::optional<segweave::session::SessionReport> final_report_;
};

}  // namespace segweave::tests::fixtures

#endif  // SEGWEAVE_TESTS_FIXTURES_RECORDING_EVENT_SINK_H_
