// ITrackCompiler that records every request and writes a placeholder output
// file on success. Can be scripted to fail.

#ifndef SEGWEAVE_TESTS_FIXTURES_RECORDING_TRACK_COMPILER_H_
#define SEGWEAVE_TESTS_FIXTURES_RECORDING_TRACK_COMPILER_H_

#include <fstream>
#include <string>
#include <vector>

#include "segweave/compile/TrackCompiler.hpp"

namespace segweave::tests::fixtures {

class RecordingTrackCompiler : public segweave::compile::ITrackCompiler {
 public:
  static constexpr const char* kPlaceholder = "MP4";

  void FailWith(SessionError error, const std::string& detail) {
    fail_error_ = error;
    fail_detail_ = detail;
  }

  const std::vector<segweave::compile::CompileRequest>& requests() const { return requests_; }
  int call_count() const { return static_cast<int>(requests_.size()); }

  segweave::compile::CompileResult Compile(const segweave::compile::CompileRequest& request,
                                           const std::atomic<bool>* cancel) override {
    requests_.push_back(request);
    if (cancel && cancel->load(std::memory_order_acquire)) {
      return segweave::compile::CompileResult::Failure(SessionError::kCancelled, "cancelled");
    }
    if (fail_error_ != SessionError::kNone) {
      return segweave::compile::CompileResult::Failure(fail_error_, fail_detail_);
    }
    std::ofstream out(request.output_path, std::ios::binary | std::ios::trunc);
    out << kPlaceholder;
    out.close();
    return segweave::compile::CompileResult::Success(request.output_path, 3);
  }

 private:
  std::vector<segweave::compile::CompileRequest> requests_;
  SessionError fail_error_ = SessionError::kNone;
  std::string fail_detail_;
};

}  // namespace segweave::tests::fixtures

#endif  // SEGWEAVE_TESTS_FIXTURES_RECORDING_TRACK_COMPILER_H_
