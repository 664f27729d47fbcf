// Repository: Segweave
// Component: CLI Arguments
// Purpose: Command-line parsing for the segweave executable and the rule
//          that decides between one-shot and interactive runs.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_APP_CLI_ARGS_HPP_
#define SEGWEAVE_APP_CLI_ARGS_HPP_

#include <string>

#include "segweave/session/SessionTypes.hpp"

namespace segweave::app {

struct CliArgs {
  std::string url;
  std::string manifest_path;  // --manifest: local JSON instead of the network
  session::SessionConfig session;
  bool interactive = false;   // --interactive / -i as given

  bool help = false;
  bool valid = false;
  std::string error;

  // Interactive when asked for, or when there is nothing to run and the
  // user did not ask for quiet output.
  bool RunsInteractive() const {
    return interactive ||
           (url.empty() && manifest_path.empty() && !session.quiet);
  }
};

// Accepts an optional leading "run" command. A URL given together with
// --interactive becomes the first recording of the interactive loop.
CliArgs ParseArgs(int argc, const char* const argv[]);

void PrintUsage(const char* program_name);

}  // namespace segweave::app

#endif  // SEGWEAVE_APP_CLI_ARGS_HPP_
