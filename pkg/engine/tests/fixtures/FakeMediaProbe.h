// IMediaProbe that answers from a table keyed by file basename. Missing
// files fail the probe, like a real demuxer would.

#ifndef SEGWEAVE_TESTS_FIXTURES_FAKE_MEDIA_PROBE_H_
#define SEGWEAVE_TESTS_FIXTURES_FAKE_MEDIA_PROBE_H_

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "segweave/fetch/MediaProbe.hpp"

namespace segweave::tests::fixtures {

class FakeMediaProbe : public segweave::fetch::IMediaProbe {
 public:
  void Set(const std::string& basename, segweave::fetch::ProbeResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_[basename] = std::move(result);
  }

  void SetVideo(const std::string& basename, double duration_s) {
    Set(basename, segweave::fetch::ProbeResult::Success(MediaKind::kVideo, duration_s));
  }

  void SetVideoWithAudio(const std::string& basename, double duration_s) {
    Set(basename, segweave::fetch::ProbeResult::Success(MediaKind::kVideo, duration_s, true));
  }

  void SetAudio(const std::string& basename, double duration_s) {
    Set(basename, segweave::fetch::ProbeResult::Success(MediaKind::kAudio, duration_s));
  }

  void SetUnreadable(const std::string& basename) {
    Set(basename, segweave::fetch::ProbeResult::Failure("no decodable stream"));
  }

  int ProbeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_count_;
  }

  segweave::fetch::ProbeResult Probe(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++probe_count_;
    if (!std::filesystem::exists(path)) {
      return segweave::fetch::ProbeResult::Failure("No such file or directory");
    }
    auto it = results_.find(std::filesystem::path(path).filename().string());
    if (it == results_.end()) {
      return segweave::fetch::ProbeResult::Failure("Invalid data found when processing input");
    }
    return it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, segweave::fetch::ProbeResult> results_;
  int probe_count_ = 0;
};

}  // namespace segweave::tests::fixtures

#endif  // SEGWEAVE_TESTS_FIXTURES_FAKE_MEDIA_PROBE_H_
