// Repository: Segweave
// Component: Segment Fetcher
// Purpose: Retrieve one segment into the cache directory (skip if present,
//          resume broken transfers, never leave a partial cache entry) and
//          probe it.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_FETCH_SEGMENT_FETCHER_HPP_
#define SEGWEAVE_FETCH_SEGMENT_FETCHER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "segweave/fetch/HttpClient.hpp"
#include "segweave/fetch/MediaProbe.hpp"
#include "segweave/manifest/SegmentTypes.hpp"

namespace segweave::fetch {

struct FetcherConfig {
  std::string cache_dir;                // Must be set
  int max_resume_attempts = 3;          // Extra attempts after a broken transfer
  long connect_timeout_ms = 15000;
  long stall_timeout_ms = 60000;        // Abort when no bytes arrive for this long
  int64_t progress_step_bytes = 1 << 20;
  std::string referer = "https://my.mts-link.ru/";
  std::string origin = "https://events-storage.webinar.ru";
};

struct FetchProgress {
  std::string filename;
  int64_t bytes = 0;
  std::optional<int64_t> total;  // Unset when content-length is unknown
};

using FetchProgressFn = std::function<void(const FetchProgress&)>;

struct FetchResult {
  bool ok;
  SessionError error;  // kFetchError, kProbeError or kCancelled on failure
  std::string detail;
  FetchedSegment segment;
  bool network_used;   // False when the cache entry already existed

  static FetchResult Success(FetchedSegment seg, bool network_used) {
    return {true, SessionError::kNone, "", std::move(seg), network_used};
  }

  static FetchResult Failure(SessionError err, const std::string& detail,
                             bool network_used) {
    return {false, err, detail, {}, network_used};
  }
};

// SegmentFetcher is stateless apart from its config and collaborators, so a
// single instance may serve every worker of a FetchWorkerPool. Distinct
// refs write distinct files; no locking is needed around the cache dir.
//
// Download protocol:
//   <cache_dir>/<cache_filename>.part is written, then renamed to the cache
//   path once the body is complete. A transfer that breaks mid-stream is
//   resumed with "Range: bytes=<written>-" up to max_resume_attempts times
//   (206 appends, 200 restarts from zero). Any other failure, or
//   cancellation, removes the .part file.
class SegmentFetcher {
 public:
  SegmentFetcher(FetcherConfig config, IHttpClient& http, IMediaProbe& probe);

  FetchResult Fetch(const SegmentRef& ref, const std::atomic<bool>* cancel) const;

  std::string CachePathFor(const SegmentRef& ref) const;

  // Called from worker threads; the callback must be thread-safe.
  void SetProgressCallback(FetchProgressFn fn);

  const FetcherConfig& config() const { return config_; }

 private:
  FetchResult Download(const SegmentRef& ref, const std::string& path,
                       const std::atomic<bool>* cancel) const;
  FetchResult ProbeCached(const SegmentRef& ref, const std::string& path,
                          bool network_used) const;
  HttpRequest BuildRequest(const SegmentRef& ref) const;
  void ReportProgress(const FetchProgress& p) const;

  FetcherConfig config_;
  IHttpClient& http_;
  IMediaProbe& probe_;

  mutable std::mutex progress_mutex_;
  FetchProgressFn progress_fn_;
};

}  // namespace segweave::fetch

#endif  // SEGWEAVE_FETCH_SEGMENT_FETCHER_HPP_
