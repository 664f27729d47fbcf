// Repository: Segweave
// Component: Segment Fetcher Implementation
// Copyright (c) 2025 Segweave

#include "segweave/fetch/SegmentFetcher.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "segweave/util/Logger.hpp"

namespace segweave::fetch {

namespace fs = std::filesystem;
using segweave::util::Logger;

namespace {

void RemoveQuietly(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    Logger::Warn("[SegmentFetcher] CLEANUP_FAILED path=" + path + " err=" + ec.message());
  }
}

}  // namespace

SegmentFetcher::SegmentFetcher(FetcherConfig config, IHttpClient& http, IMediaProbe& probe)
    : config_(std::move(config)), http_(http), probe_(probe) {}

void SegmentFetcher::SetProgressCallback(FetchProgressFn fn) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  progress_fn_ = std::move(fn);
}

void SegmentFetcher::ReportProgress(const FetchProgress& p) const {
  FetchProgressFn fn;
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    fn = progress_fn_;
  }
  if (fn) fn(p);
}

std::string SegmentFetcher::CachePathFor(const SegmentRef& ref) const {
  return (fs::path(config_.cache_dir) / ref.cache_filename).string();
}

HttpRequest SegmentFetcher::BuildRequest(const SegmentRef& ref) const {
  HttpRequest req;
  req.url = ref.url;
  req.connect_timeout_ms = config_.connect_timeout_ms;
  req.timeout_ms = config_.stall_timeout_ms;
  req.headers = {
      "Accept: video/mp4,video/webm,video/ogg,application/octet-stream,*/*;q=0.8",
      "Accept-Language: en-US,en;q=0.9",
      "Referer: " + config_.referer,
      "Origin: " + config_.origin,
  };
  return req;
}

// =============================================================================
// Fetch
// =============================================================================

FetchResult SegmentFetcher::Fetch(const SegmentRef& ref,
                                  const std::atomic<bool>* cancel) const {
  const std::string path = CachePathFor(ref);

  std::error_code ec;
  if (fs::exists(path, ec)) {
    Logger::Info("[SegmentFetcher] CACHE_HIT file=" + ref.cache_filename);
    return ProbeCached(ref, path, /*network_used=*/false);
  }

  if (cancel && cancel->load(std::memory_order_acquire)) {
    return FetchResult::Failure(SessionError::kCancelled, "cancelled before start", false);
  }

  Logger::Info("[SegmentFetcher] DOWNLOAD_START file=" + ref.cache_filename);
  FetchResult dl = Download(ref, path, cancel);
  if (!dl.ok) return dl;
  return ProbeCached(ref, path, /*network_used=*/true);
}

FetchResult SegmentFetcher::Download(const SegmentRef& ref,
                                     const std::string& path,
                                     const std::atomic<bool>* cancel) const {
  const std::string part_path = path + ".part";

  std::error_code ec;
  fs::create_directories(config_.cache_dir, ec);
  if (ec) {
    return FetchResult::Failure(SessionError::kFetchError,
                                "cannot create cache dir: " + ec.message(), false);
  }

  std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return FetchResult::Failure(SessionError::kFetchError,
                                "cannot open " + part_path + " for writing", false);
  }

  const HttpRequest req = BuildRequest(ref);
  int64_t written = 0;
  int64_t next_report = config_.progress_step_bytes;
  std::optional<int64_t> total;
  bool write_failed = false;
  std::string last_error;

  StreamCallbacks cb;
  cb.on_response = [&](long status, std::optional<int64_t> content_length) {
    if (status == 206) {
      if (content_length) total = written + *content_length;
      return;
    }
    // Full body: the server ignored the range, start the file over.
    if (written > 0) {
      out.close();
      out.open(part_path, std::ios::binary | std::ios::trunc);
      written = 0;
      next_report = config_.progress_step_bytes;
    }
    total = content_length;
  };
  cb.on_data = [&](const char* data, size_t len) {
    out.write(data, static_cast<std::streamsize>(len));
    if (!out) {
      write_failed = true;
      return false;
    }
    written += static_cast<int64_t>(len);
    if (written >= next_report) {
      next_report = written + config_.progress_step_bytes;
      ReportProgress({ref.cache_filename, written, total});
    }
    return true;
  };

  for (int attempt = 0; attempt <= config_.max_resume_attempts; ++attempt) {
    StreamResult r = http_.Stream(req, written, cb, cancel);

    bool done = r.completed;
    // Connection dropped exactly at the end of a resumed body.
    if (!done && r.status == 416 && total && written == *total) done = true;

    if (done) {
      out.flush();
      out.close();
      if (out.fail()) {
        RemoveQuietly(part_path);
        return FetchResult::Failure(SessionError::kFetchError,
                                    "write failed for " + part_path, true);
      }
      fs::rename(part_path, path, ec);
      if (ec) {
        RemoveQuietly(part_path);
        return FetchResult::Failure(SessionError::kFetchError,
                                    "rename failed: " + ec.message(), true);
      }
      ReportProgress({ref.cache_filename, written, total});
      std::ostringstream oss;
      oss << "[SegmentFetcher] DOWNLOAD_OK file=" << ref.cache_filename
          << " bytes=" << written;
      Logger::Info(oss.str());
      return FetchResult::Success({}, true);
    }

    if (r.cancelled) {
      out.close();
      RemoveQuietly(part_path);
      Logger::Info("[SegmentFetcher] DOWNLOAD_CANCELLED file=" + ref.cache_filename);
      return FetchResult::Failure(SessionError::kCancelled, "cancelled", true);
    }

    last_error = r.error;
    if (write_failed || r.status >= 400) break;  // Not resumable

    if (attempt < config_.max_resume_attempts) {
      std::ostringstream oss;
      oss << "[SegmentFetcher] DOWNLOAD_RESUME file=" << ref.cache_filename
          << " from_byte=" << written
          << " attempt=" << (attempt + 1) << "/" << config_.max_resume_attempts
          << " err=" << r.error;
      Logger::Warn(oss.str());
    }
  }

  out.close();
  RemoveQuietly(part_path);

  std::ostringstream detail;
  detail << "download of " << ref.url << " failed: "
         << (write_failed ? "local write error" : last_error);
  Logger::Error("[SegmentFetcher] DOWNLOAD_FAILED file=" + ref.cache_filename +
                " err=" + (write_failed ? std::string("local write error") : last_error));
  return FetchResult::Failure(SessionError::kFetchError, detail.str(), true);
}

FetchResult SegmentFetcher::ProbeCached(const SegmentRef& ref,
                                        const std::string& path,
                                        bool network_used) const {
  ProbeResult probe = probe_.Probe(path);
  if (!probe.ok) {
    Logger::Warn("[SegmentFetcher] PROBE_FAILED file=" + ref.cache_filename +
                 " err=" + probe.error);
    return FetchResult::Failure(SessionError::kProbeError,
                                "cannot read " + path + " as video or audio: " + probe.error,
                                network_used);
  }

  FetchedSegment seg;
  seg.ref = ref;
  seg.local_path = path;
  seg.probed_duration_s = probe.duration_s;
  seg.probed_kind = probe.kind;
  seg.has_embedded_audio = probe.kind == MediaKind::kVideo && probe.has_audio;
  return FetchResult::Success(std::move(seg), network_used);
}

}  // namespace segweave::fetch
