// Repository: Segweave
// Component: Session Orchestrator Implementation
// Copyright (c) 2025 Segweave

#include "segweave/session/SessionOrchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <unordered_map>

#include "segweave/fetch/FetchWorkerPool.hpp"
#include "segweave/fetch/SegmentFetcher.hpp"
#include "segweave/manifest/ManifestClient.hpp"
#include "segweave/timeline/TimelineReconstructor.hpp"
#include "segweave/util/Logger.hpp"

namespace segweave::session {

namespace fs = std::filesystem;
using segweave::fetch::FetchResult;
using segweave::fetch::FetchWorkerPool;
using segweave::fetch::SegmentFetcher;
using segweave::manifest::ManifestClient;
using segweave::manifest::ManifestNormalizer;
using segweave::timeline::SlotList;
using segweave::timeline::TimelineReconstructor;
using segweave::util::Logger;

// =============================================================================
// SessionRun: state of one Run() call
// =============================================================================

struct SessionOrchestrator::SessionRun {
  SessionStateMachine sm;
  SessionReport report;
  manifest::Manifest manifest;
  std::string cache_dir;

  // One entry per distinct cache filename; refs_by_unique maps each back to
  // the manifest refs that share it.
  std::vector<SegmentRef> unique_refs;
  std::vector<std::vector<size_t>> refs_by_unique;
  std::vector<std::optional<FetchResult>> fetch_results;

  std::vector<FetchedSegment> video;
  std::vector<FetchedSegment> audio;
  SlotList video_slots;
  SlotList audio_slots;
};

SessionOrchestrator::SessionOrchestrator(fetch::IHttpClient& http,
                                         fetch::IMediaProbe& probe,
                                         compile::ITrackCompiler& compiler)
    : http_(http), probe_(probe), compiler_(compiler) {}

// =============================================================================
// Entry points
// =============================================================================

SessionReport SessionOrchestrator::RunUrl(const std::string& manifest_url,
                                          SessionContext& ctx) {
  ManifestClient client(http_);
  ManifestClient::FetchResult fetched = client.FetchManifest(manifest_url,
                                                             ctx.config.session_token);
  if (!fetched.ok) {
    SessionRun run;
    run.report.cause_chain.push_back(fetched.detail);
    FailSession(run, ctx, fetched.error, "could not retrieve manifest from " + manifest_url);
    return run.report;
  }
  return Run(fetched.document, ctx);
}

SessionReport SessionOrchestrator::Run(const nlohmann::json& manifest_doc,
                                       SessionContext& ctx) {
  SessionRun run;
  run.sm.SetTransitionCallback([&ctx](SessionPhase from, SessionPhase to) {
    ctx.events.OnPhaseChanged(from, to);
  });

  // --- Normalize (before any fetch) ---
  ManifestNormalizer::NormalizeResult normalized = ManifestNormalizer::Normalize(manifest_doc);
  if (!normalized.valid) {
    run.report.cause_chain.push_back(normalized.detail);
    FailSession(run, ctx, normalized.error, "manifest rejected: " + normalized.detail);
    return run.report;
  }
  run.manifest = std::move(normalized.manifest);

  const std::string name = ManifestNormalizer::SanitizeFilename(run.manifest.name);
  run.cache_dir = (fs::path(ctx.config.output_dir) / name).string();
  run.report.session_name = name;
  run.report.cache_dir = run.cache_dir;
  run.report.output_path = (fs::path(run.cache_dir) / (name + ".mp4")).string();
  run.report.segments_total = static_cast<int32_t>(run.manifest.segments.size());
  run.report.skipped_entries = run.manifest.skipped_entries;

  {
    std::ostringstream oss;
    oss << "[SessionOrchestrator] SESSION_START name=" << name
        << " duration_s=" << run.manifest.total_duration_s
        << " segments=" << run.report.segments_total
        << " skipped_entries=" << run.report.skipped_entries
        << " cache_dir=" << run.cache_dir;
    Logger::Info(oss.str());
  }

  std::error_code ec;
  fs::create_directories(run.cache_dir, ec);
  if (ec) {
    run.report.cause_chain.push_back(ec.message());
    FailSession(run, ctx, SessionError::kIoError,
                "cannot create cache directory " + run.cache_dir);
    return run.report;
  }

  if (ctx.Cancelled()) {
    FailSession(run, ctx, SessionError::kCancelled, "cancelled before fetching");
    return run.report;
  }

  if (!FetchAll(run, ctx)) return run.report;
  if (!Reconstruct(run, ctx)) return run.report;
  if (!Compile(run, ctx)) return run.report;
  CleanUp(run, ctx);
  Finish(run, ctx);
  return run.report;
}

// =============================================================================
// Fetching
// =============================================================================

bool SessionOrchestrator::FetchAll(SessionRun& run, SessionContext& ctx) {
  run.sm.Advance(SessionPhase::kFetching);

  // Refs that share a cache filename share one download.
  std::unordered_map<std::string, size_t> unique_index;
  for (size_t i = 0; i < run.manifest.segments.size(); ++i) {
    const SegmentRef& ref = run.manifest.segments[i];
    auto [it, inserted] = unique_index.emplace(ref.cache_filename, run.unique_refs.size());
    if (inserted) {
      run.unique_refs.push_back(ref);
      run.refs_by_unique.emplace_back();
    }
    run.refs_by_unique[it->second].push_back(i);
  }
  run.fetch_results.resize(run.unique_refs.size());

  fetch::FetcherConfig fetcher_config;
  fetcher_config.cache_dir = run.cache_dir;
  SegmentFetcher fetcher(fetcher_config, http_, probe_);
  fetcher.SetProgressCallback([&ctx](const fetch::FetchProgress& p) {
    ctx.events.OnFetchProgress({p.filename, p.bytes, p.total});
  });

  {
    std::ostringstream oss;
    oss << "[SessionOrchestrator] FETCH_START unique_files=" << run.unique_refs.size()
        << " workers=" << ctx.config.worker_count;
    Logger::Info(oss.str());
  }

  {
    FetchWorkerPool pool(ctx.config.worker_count, ctx.cancel);
    for (size_t u = 0; u < run.unique_refs.size(); ++u) {
      pool.Submit([&run, &fetcher, &ctx, u](const std::atomic<bool>& cancel) {
        FetchResult r = fetcher.Fetch(run.unique_refs[u], &cancel);
        const SegmentRef& ref = run.unique_refs[u];
        if (r.ok) {
          ctx.events.OnSegmentFetched({ref.cache_filename, ref.manifest_index,
                                       r.segment.probed_kind, r.segment.probed_duration_s,
                                       !r.network_used});
        } else if (r.error != SessionError::kCancelled) {
          ctx.events.OnSegmentLost({ref.cache_filename, ref.manifest_index, r.error, r.detail});
        }
        // Each job writes only its own slot.
        run.fetch_results[u] = std::move(r);
      });
    }
    pool.WaitAll();

    if (pool.CancelRequested() || ctx.Cancelled()) {
      // Cancel() has joined in-flight jobs; fetchers removed their .part files.
      FailSession(run, ctx, SessionError::kCancelled, "cancelled during fetch");
      return false;
    }
  }

  // --- Tally, then expand unique results back to per-ref segments ---
  std::vector<std::string> loss_details;
  for (size_t u = 0; u < run.unique_refs.size(); ++u) {
    const auto& result = run.fetch_results[u];
    const auto ref_count = static_cast<int32_t>(run.refs_by_unique[u].size());
    if (result && result->network_used) ++run.report.network_fetches;

    if (!result || !result->ok) {
      const SessionError err = result ? result->error : SessionError::kFetchError;
      if (err == SessionError::kProbeError) {
        run.report.probe_failures += ref_count;
      } else {
        run.report.fetch_failures += ref_count;
      }
      loss_details.push_back(run.unique_refs[u].cache_filename + ": " +
                             (result ? result->detail : std::string("not fetched")));
      continue;
    }

    for (size_t ref_index : run.refs_by_unique[u]) {
      FetchedSegment seg = result->segment;
      seg.ref = run.manifest.segments[ref_index];
      if (seg.probed_kind == MediaKind::kVideo) {
        run.video.push_back(std::move(seg));
      } else {
        run.audio.push_back(std::move(seg));
      }
    }
  }
  run.report.video_segments = static_cast<int32_t>(run.video.size());
  run.report.audio_segments = static_cast<int32_t>(run.audio.size());

  // Without separate audio segments, the audio channel is the video
  // segments' own soundtrack at the same timeline positions.
  if (run.audio.empty()) {
    for (const FetchedSegment& seg : run.video) {
      if (seg.has_embedded_audio) run.audio.push_back(seg);
    }
    if (!run.audio.empty()) {
      run.report.audio_from_video = true;
      Logger::Info("[SessionOrchestrator] AUDIO_FROM_VIDEO segments=" +
                   std::to_string(run.audio.size()));
    }
  }

  {
    std::ostringstream oss;
    oss << "[SessionOrchestrator] FETCH_DONE video=" << run.video.size()
        << " audio=" << run.audio.size()
        << " fetch_failures=" << run.report.fetch_failures
        << " probe_failures=" << run.report.probe_failures
        << " network_fetches=" << run.report.network_fetches;
    Logger::Info(oss.str());
  }

  if (run.video.empty() && run.audio.empty()) {
    if (ctx.config.debug) WriteDebugDump(run);
    for (auto& d : loss_details) run.report.cause_chain.push_back(std::move(d));
    std::ostringstream oss;
    oss << "no usable segments (" << run.report.segments_lost() << " of "
        << run.report.segments_total << " lost)";
    FailSession(run, ctx, SessionError::kNoContent, oss.str());
    return false;
  }
  return true;
}

// =============================================================================
// Reconstructing
// =============================================================================

bool SessionOrchestrator::Reconstruct(SessionRun& run, SessionContext& ctx) {
  if (ctx.Cancelled()) {
    FailSession(run, ctx, SessionError::kCancelled, "cancelled before reconstruction");
    return false;
  }
  run.sm.Advance(SessionPhase::kReconstructing);

  const double total = run.manifest.total_duration_s;
  struct Channel {
    MediaKind kind;
    std::vector<FetchedSegment>* segments;
    SlotList* slots;
  };
  const Channel channels[] = {
      {MediaKind::kVideo, &run.video, &run.video_slots},
      {MediaKind::kAudio, &run.audio, &run.audio_slots},
  };

  for (const Channel& ch : channels) {
    auto result = TimelineReconstructor::Reconstruct(*ch.segments, total, MediaKindName(ch.kind));
    if (!result.valid) {
      run.report.cause_chain.push_back(result.detail);
      FailSession(run, ctx, result.error,
                  std::string("reconstruction failed for ") + MediaKindName(ch.kind));
      return false;
    }
    auto check = TimelineReconstructor::ValidateTimeline(result.slots, total);
    if (!check.valid) {
      run.report.cause_chain.push_back(check.detail);
      FailSession(run, ctx, SessionError::kInvalidManifest,
                  std::string("timeline invariant violated for ") + MediaKindName(ch.kind));
      return false;
    }

    TimelineBuiltPayload built;
    built.channel = ch.kind;
    for (const auto& slot : result.slots) {
      if (slot.is_content()) {
        ++built.content_slots;
      } else {
        ++built.filler_slots;
      }
    }
    built.warnings = static_cast<int32_t>(result.warnings.size());
    run.report.timeline_warnings += built.warnings;
    ctx.events.OnTimelineBuilt(built);

    *ch.slots = std::move(result.slots);
  }
  return true;
}

// =============================================================================
// Compiling
// =============================================================================

bool SessionOrchestrator::Compile(SessionRun& run, SessionContext& ctx) {
  if (ctx.Cancelled()) {
    FailSession(run, ctx, SessionError::kCancelled, "cancelled before compile");
    return false;
  }
  run.sm.Advance(SessionPhase::kCompiling);

  compile::CompileRequest request;
  request.video_slots = run.video_slots;
  request.audio_slots = run.audio_slots;
  request.total_duration_s = run.manifest.total_duration_s;
  request.truncate_at_s = ctx.config.max_duration_s;
  request.output_path = run.report.output_path;

  compile::CompileResult result = compiler_.Compile(request, ctx.cancel);
  if (!result.ok) {
    run.report.cause_chain.push_back(result.detail);
    if (result.error == SessionError::kCancelled) {
      FailSession(run, ctx, SessionError::kCancelled, "cancelled during compile");
    } else {
      FailSession(run, ctx, SessionError::kCompileError,
                  "compile failed; cache files kept for retry");
    }
    return false;
  }
  run.report.output_path = result.output_path;
  run.report.output_bytes = result.output_bytes;
  return true;
}

// =============================================================================
// CleaningUp
// =============================================================================

void SessionOrchestrator::CleanUp(SessionRun& run, SessionContext& ctx) {
  run.sm.Advance(SessionPhase::kCleaningUp);

  if (ctx.config.keep_files) {
    Logger::Info("[SessionOrchestrator] CLEANUP_SKIPPED keep_files=true");
    return;
  }

  std::error_code ec;
  if (!fs::exists(run.report.output_path, ec)) {
    Logger::Warn("[SessionOrchestrator] CLEANUP_SKIPPED output missing: " + run.report.output_path);
    return;
  }

  const fs::path output = fs::path(run.report.output_path);
  // Every unique cache file goes, including ones that downloaded but failed
  // to probe.
  for (size_t u = 0; u < run.unique_refs.size(); ++u) {
    const fs::path cached = fs::path(run.cache_dir) / run.unique_refs[u].cache_filename;
    if (cached == output || cached.extension() == ".json") continue;

    if (fs::remove(cached, ec)) {
      ++run.report.deleted_cache_files;
      Logger::Debug("[SessionOrchestrator] DELETED " + cached.string());
    } else if (ec) {
      Logger::Warn("[SessionOrchestrator] DELETE_FAILED path=" + cached.string() +
                   " err=" + ec.message());
    }
  }

  std::ostringstream oss;
  oss << "[SessionOrchestrator] CLEANUP_DONE deleted=" << run.report.deleted_cache_files;
  Logger::Info(oss.str());
}

// =============================================================================
// Terminal helpers
// =============================================================================

void SessionOrchestrator::Finish(SessionRun& run, SessionContext& ctx) {
  run.sm.Advance(SessionPhase::kDone);
  run.report.ok = true;
  run.report.phase = SessionPhase::kDone;
  run.report.error = SessionError::kNone;
  ctx.events.OnSessionFinished(run.report);
}

void SessionOrchestrator::FailSession(SessionRun& run, SessionContext& ctx,
                                      SessionError error, const std::string& detail) {
  run.sm.Fail();
  run.report.ok = false;
  run.report.phase = SessionPhase::kFailed;
  run.report.failed_phase = run.sm.failed_from();
  run.report.error = error;
  run.report.detail = detail;
  run.report.output_path.clear();  // Never produced on a failed session
  ctx.events.OnSessionFinished(run.report);
}

void SessionOrchestrator::WriteDebugDump(const SessionRun& run) const {
  const std::string path = (fs::path(run.cache_dir) / kDebugDumpFilename).string();
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    Logger::Warn("[SessionOrchestrator] DEBUG_DUMP_FAILED path=" + path);
    return;
  }
  out << run.manifest.raw.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  Logger::Info("[SessionOrchestrator] DEBUG_DUMP path=" + path);
}

}  // namespace segweave::session
