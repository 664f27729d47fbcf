// Repository: Segweave
// Component: segweave CLI
// Purpose: Command-line entry point. Resolves a recording URL (or a local
//          manifest file) and runs one reconstruction session per input.
// Copyright (c) 2025 Segweave
//
// MODES OF OPERATION:
// 1. Command:     segweave run <url> [options]
// 2. Shorthand:   segweave <url> [options]
// 3. Interactive: segweave [--interactive [url]]
// 4. Offline:     segweave run --manifest debug_data.json [options]

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "segweave/app/CliArgs.hpp"
#include "segweave/compile/FFmpegTrackCompiler.hpp"
#include "segweave/fetch/HttpClient.hpp"
#include "segweave/fetch/MediaProbe.hpp"
#include "segweave/manifest/ManifestClient.hpp"
#include "segweave/session/SessionEvents.hpp"
#include "segweave/session/SessionOrchestrator.hpp"
#include "segweave/util/Logger.hpp"

namespace {

using segweave::app::CliArgs;
using segweave::manifest::ManifestClient;
using segweave::session::SessionConfig;
using segweave::session::SessionContext;
using segweave::session::SessionReport;
using segweave::util::Logger;

constexpr const char* kLogFilePath = "logs/segweave.log";

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// Interactive prompts
// =============================================================================

std::string Prompt(const std::string& question) {
  std::cout << question << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) return "";
  const auto first = line.find_first_not_of(" \t\r");
  if (first == std::string::npos) return "";
  const auto last = line.find_last_not_of(" \t\r");
  return line.substr(first, last - first + 1);
}

bool PromptYesNo(const std::string& question) {
  std::string answer = Prompt(question + " (y/N): ");
  return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

// Fills url and session settings from stdin. A url already in args is used
// as-is when ask_url is false. Returns false on EOF.
bool PromptForSession(CliArgs& args, bool ask_url) {
  std::cout << "\n============================================================\n"
            << "Segweave - Interactive Mode\n"
            << "============================================================\n";

  if (!ask_url && !args.url.empty()) {
    std::cout << "\nRecording URL: " << args.url << "\n";
  }
  while (ask_url || args.url.empty()) {
    if (!std::cin) return false;
    std::string url = Prompt("\nRecording URL: ");
    if (url.empty()) {
      std::cout << "URL cannot be empty.\n";
      continue;
    }
    if (!ManifestClient::IsRecordUrl(url)) {
      std::cout << "Not a recording URL. Expected e.g.\n"
                << "  https://my.mts-link.ru/12345678/987654321/record-new/123456789\n"
                << "  https://my.mts-link.ru/12345678/987654321/record-new/123456789"
                   "/record-file/1234567890\n";
      continue;
    }
    args.url = url;
    break;
  }

  args.session.session_token.clear();
  if (PromptYesNo("\nPrivate recording requiring a session id?")) {
    args.session.session_token = Prompt("  Session id (browser cookie sessionId): ");
    if (args.session.session_token.empty()) {
      std::cout << "  No session id given, trying without it.\n";
    }
  }

  std::string output_dir = Prompt("\nOutput directory [downloads]: ");
  args.session.output_dir = output_dir.empty() ? "downloads" : output_dir;

  args.session.max_duration_s.reset();
  std::string max_duration = Prompt("\nMaximum duration in seconds [no limit]: ");
  if (!max_duration.empty()) {
    try {
      double seconds = std::stod(max_duration);
      if (seconds > 0) {
        args.session.max_duration_s = seconds;
      } else {
        std::cout << "  Invalid duration, using no limit.\n";
      }
    } catch (const std::exception&) {
      std::cout << "  Invalid number, using no limit.\n";
    }
  }

  args.session.keep_files = PromptYesNo("\nKeep downloaded segment files?");
  args.session.debug = PromptYesNo("\nEnable debug mode?");
  return true;
}

// =============================================================================
// Session execution
// =============================================================================

std::optional<nlohmann::json> LoadManifestFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    Logger::Error("[CLI] MANIFEST_OPEN_FAILED path=" + path);
    return std::nullopt;
  }
  nlohmann::json doc = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    Logger::Error("[CLI] MANIFEST_PARSE_FAILED path=" + path);
    return std::nullopt;
  }
  return doc;
}

bool RunSession(const CliArgs& args) {
  Logger::SetQuiet(args.session.quiet);
  if (args.session.debug) Logger::SetDebugEnabled(true);

  segweave::fetch::CurlHttpClient http;
  segweave::fetch::FFmpegMediaProbe probe;
  segweave::compile::FFmpegTrackCompiler compiler;
  segweave::session::LoggerEventSink events;
  segweave::session::SessionOrchestrator orchestrator(http, probe, compiler);

  SessionContext ctx{args.session, events, &g_termination_requested};

  SessionReport report;
  if (!args.manifest_path.empty()) {
    Logger::Info("[CLI] MANIFEST_FILE path=" + args.manifest_path);
    auto doc = LoadManifestFile(args.manifest_path);
    if (!doc) return false;
    report = orchestrator.Run(*doc, ctx);
  } else {
    auto ids = ManifestClient::ParseRecordUrl(args.url);
    if (!ids) {
      Logger::Error("[CLI] INVALID_URL url=" + args.url);
      return false;
    }
    const std::string manifest_url = ManifestClient::BuildManifestUrl(*ids);
    std::ostringstream oss;
    oss << "[CLI] RECORD event_session=" << ids->event_session_id
        << " record=" << ids->record_id.value_or("-")
        << " manifest=" << manifest_url;
    Logger::Info(oss.str());
    report = orchestrator.RunUrl(manifest_url, ctx);
  }

  if (report.ok) {
    std::cout << "\nSaved " << report.output_path << "\n";
    if (report.segments_lost() > 0) {
      std::cout << report.segments_lost() << " of " << report.segments_total
                << " segments could not be used (see log).\n";
    }
  } else {
    std::cerr << "\nFailed: " << report.detail << "\n";
  }
  return report.ok;
}

int RunInteractive(CliArgs args) {
  bool all_ok = true;
  bool ask_url = args.url.empty();
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    if (!PromptForSession(args, ask_url)) break;
    ask_url = true;
    if (!RunSession(args)) all_ok = false;
    if (g_termination_requested.load(std::memory_order_acquire)) break;
    if (!PromptYesNo("\nProcess another recording?")) break;
  }
  return all_ok ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = segweave::app::ParseArgs(argc, argv);

  if (args.help) {
    segweave::app::PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    segweave::app::PrintUsage(argv[0]);
    return 1;
  }

  if (!Logger::SetLogFile(kLogFilePath)) {
    std::cerr << "Warning: cannot open log file " << kLogFilePath << "\n";
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  if (args.RunsInteractive()) {
    return RunInteractive(args);
  }
  return RunSession(args) ? 0 : 1;
}
