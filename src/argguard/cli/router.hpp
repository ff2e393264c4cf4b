#pragma once

#include "core/logging/logger.hpp"

#include <string>
#include <vector>

namespace argguard::cli {

// Options for `argguard check-file`, shared with in-process callers.
struct CheckFileOptions {
  std::vector<std::string> paths;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs the file guard over every path in order and stops at the first failure.
// Returns the exit code mapped from the failure kind (see core/errors/exit_codes.hpp)
// or 0 when every path names an existing file.
int ExecuteCheckFile(const CheckFileOptions& options, core::logging::Logger& logger);

// Routes `argguard` subcommands and returns process exit codes:
//   0      => success
//   1      => command failed after valid invocation
//   2      => usage error (unknown command / invalid args)
//   10..12 => guard failure (null argument / invalid argument / invalid state)
int Dispatch(int argc, char** argv);

} // namespace argguard::cli
