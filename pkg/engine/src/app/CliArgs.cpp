// Repository: Segweave
// Component: CLI Arguments Implementation
// Copyright (c) 2025 Segweave

#include "segweave/app/CliArgs.hpp"

#include <iostream>
#include <stdexcept>

#include "segweave/fetch/FetchWorkerPool.hpp"
#include "segweave/manifest/ManifestClient.hpp"

namespace segweave::app {

using segweave::manifest::ManifestClient;

void PrintUsage(const char* program_name) {
  std::cerr << "Usage:\n"
            << "  " << program_name << " run <url> [options]\n"
            << "  " << program_name << " <url> [options]\n"
            << "  " << program_name << " [--interactive]\n"
            << "\n"
            << "Options:\n"
            << "  --session-id S     Session cookie for private recordings\n"
            << "  --output-dir D     Output directory (default: downloads)\n"
            << "  --max-duration N   Truncate the output to N seconds\n"
            << "  --keep-files       Keep downloaded segment files after compiling\n"
            << "  --workers N        Parallel downloads (default: "
            << segweave::fetch::FetchWorkerPool::kDefaultWorkers << ")\n"
            << "  --manifest FILE    Read the manifest from a local JSON file\n"
            << "  -i, --interactive  Prompt for all settings (default with no URL)\n"
            << "  -q, --quiet        Only print warnings and errors; never prompt\n"
            << "  -d, --debug        Verbose logging; dump manifest on empty sessions\n"
            << "  -h, --help         Show this message\n"
            << "\n"
            << "Examples:\n"
            << "  " << program_name
            << " run https://my.mts-link.ru/12345678/987654321/record-new/123456789\n"
            << "  " << program_name << " run --manifest downloads/Talk/debug_data.json --debug\n";
}

CliArgs ParseArgs(int argc, const char* const argv[]) {
  CliArgs args;

  int i = 1;
  if (i < argc && std::string(argv[i]) == "run") ++i;

  try {
    for (; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        return args;
      } else if (arg == "--session-id" && i + 1 < argc) {
        args.session.session_token = argv[++i];
      } else if (arg == "--output-dir" && i + 1 < argc) {
        args.session.output_dir = argv[++i];
      } else if (arg == "--max-duration" && i + 1 < argc) {
        double seconds = std::stod(argv[++i]);
        if (seconds <= 0) {
          args.error = "--max-duration must be positive";
          return args;
        }
        args.session.max_duration_s = seconds;
      } else if (arg == "--workers" && i + 1 < argc) {
        int workers = std::stoi(argv[++i]);
        if (workers < 1) {
          args.error = "--workers must be at least 1";
          return args;
        }
        args.session.worker_count = workers;
      } else if (arg == "--manifest" && i + 1 < argc) {
        args.manifest_path = argv[++i];
      } else if (arg == "--keep-files") {
        args.session.keep_files = true;
      } else if (arg == "--interactive" || arg == "-i") {
        args.interactive = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.session.quiet = true;
      } else if (arg == "--debug" || arg == "-d") {
        args.session.debug = true;
      } else if (!arg.empty() && arg[0] != '-' && args.url.empty()) {
        args.url = arg;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception&) {
    args.error = "Invalid number for " + std::string(argv[i - 1]);
    return args;
  }

  if (!args.RunsInteractive() && args.url.empty() && args.manifest_path.empty()) {
    args.error = "Must specify a recording URL or --manifest when --quiet is set";
    return args;
  }

  if (!args.url.empty() && !args.manifest_path.empty()) {
    args.error = "Cannot use both a URL and --manifest";
    return args;
  }

  if (args.interactive && !args.manifest_path.empty()) {
    args.error = "--manifest cannot be combined with --interactive";
    return args;
  }

  if (!args.url.empty() && !ManifestClient::IsRecordUrl(args.url)) {
    args.error = "Not a recording URL: " + args.url;
    return args;
  }

  if (args.RunsInteractive()) {
    // Prompts are the point of interactive mode.
    args.session.quiet = false;
  }

  args.valid = true;
  return args;
}

}  // namespace segweave::app
