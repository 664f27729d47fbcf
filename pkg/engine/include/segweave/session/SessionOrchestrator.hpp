// Repository: Segweave
// Component: Session Orchestrator
// Purpose: Drive one manifest through fetch → reconstruct → compile →
//          cleanup, aggregating per-segment losses and session failures.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_SESSION_SESSION_ORCHESTRATOR_HPP_
#define SEGWEAVE_SESSION_SESSION_ORCHESTRATOR_HPP_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "segweave/compile/TrackCompiler.hpp"
#include "segweave/fetch/HttpClient.hpp"
#include "segweave/fetch/MediaProbe.hpp"
#include "segweave/manifest/ManifestNormalizer.hpp"
#include "segweave/session/SessionEvents.hpp"
#include "segweave/session/SessionStateMachine.hpp"
#include "segweave/session/SessionTypes.hpp"

namespace segweave::session {

// SessionOrchestrator holds no per-session state; Run() may be called again
// for another manifest. Collaborators are borrowed and must outlive it.
//
// Failure policy:
//   - per-segment fetch/probe errors exclude the segment and are counted;
//   - InvalidManifest aborts before the cache directory is touched;
//   - NoContent / CompileError / Cancelled abort the session with the
//     phase they occurred in. Cache files are only deleted after a
//     successful compile, and never when keep_files is set.
class SessionOrchestrator {
 public:
  static constexpr const char* kDebugDumpFilename = "debug_data.json";

  SessionOrchestrator(fetch::IHttpClient& http,
                      fetch::IMediaProbe& probe,
                      compile::ITrackCompiler& compiler);

  // Download the manifest (ManifestClient), then Run().
  SessionReport RunUrl(const std::string& manifest_url, SessionContext& ctx);

  SessionReport Run(const nlohmann::json& manifest_doc, SessionContext& ctx);

 private:
  struct SessionRun;

  bool FetchAll(SessionRun& run, SessionContext& ctx);
  bool Reconstruct(SessionRun& run, SessionContext& ctx);
  bool Compile(SessionRun& run, SessionContext& ctx);
  void CleanUp(SessionRun& run, SessionContext& ctx);

  void Finish(SessionRun& run, SessionContext& ctx);
  void FailSession(SessionRun& run, SessionContext& ctx,
                   SessionError error, const std::string& detail);
  void WriteDebugDump(const SessionRun& run) const;

  fetch::IHttpClient& http_;
  fetch::IMediaProbe& probe_;
  compile::ITrackCompiler& compiler_;
};

}  // namespace segweave::session

#endif  // SEGWEAVE_SESSION_SESSION_ORCHESTRATOR_HPP_
