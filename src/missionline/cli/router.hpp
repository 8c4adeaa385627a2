#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>

namespace missionline::cli {

// Options for `missionline replay`, also usable by in-process callers.
struct ReplayOptions {
  std::filesystem::path input_path;
  std::filesystem::path output_path;
  bool strict = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Replays one recorded stream through a fresh timeline store. Prints the
// projection JSON to stdout and writes the full report when `output_path` is
// set. Returns a process exit code.
int ExecuteReplay(const ReplayOptions& options);

// Routes `missionline` subcommands and returns process exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => `replay --strict` found undecodable lines
int Dispatch(int argc, char** argv);

} // namespace missionline::cli
