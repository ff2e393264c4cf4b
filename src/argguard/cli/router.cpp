#include "argguard/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/errors/guard_error.hpp"
#include "guard/guard.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace argguard::cli {

namespace {

constexpr std::string_view kComponent = "argguard";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  argguard check-file <path>... [--log-level <debug|info|warn|error>]\n"
      << "  argguard version\n"
      << "  argguard help\n";
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "argguard 0.1.0\n";
  return kExitSuccess;
}

// Parse `check-file` args:
// - one or more positional paths (kept in order)
// - optional `--log-level <level>`
// Unknown flags and a missing flag value are usage errors.
bool ParseCheckFileOptions(const std::vector<std::string_view>& args, CheckFileOptions& options,
                           std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level (expected " +
                core::logging::ExpectedLogLevelList() + ")";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[++i], options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (token.size() > 2 && token.substr(0, 2) == "--") {
      error = "unknown option: " + std::string(token);
      return false;
    }

    options.paths.emplace_back(token);
  }

  if (options.paths.empty()) {
    error = "check-file requires at least 1 argument: <path>...";
    return false;
  }

  return true;
}

int CommandCheckFile(const std::vector<std::string_view>& args) {
  CheckFileOptions options;
  std::string error;
  if (!ParseCheckFileOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(std::string(kComponent), options.log_level);
  return ExecuteCheckFile(options, logger);
}

} // namespace

int ExecuteCheckFile(const CheckFileOptions& options, core::logging::Logger& logger) {
  std::string param_name = "paths";
  try {
    guard::ArgumentNotNullOrEmptyWithMessage("at least one path is required", options.paths,
                                             param_name);

    for (std::size_t i = 0; i < options.paths.size(); ++i) {
      param_name = "paths[" + std::to_string(i) + "]";
      const std::string& path = guard::FileExists(options.paths[i], param_name);
      logger.Info("file present", {{"param", param_name}, {"path", path}});
      std::cout << "ok: " << path << '\n';
    }
  } catch (const core::errors::GuardError& guard_error) {
    logger.Error("guard check failed", {{"kind", core::errors::ToString(guard_error.Kind())},
                                        {"param", guard_error.ParamName()},
                                        {"detail", guard_error.Message()}});
    std::cerr << "error: " << guard_error.what() << '\n';
    return core::errors::ToInt(core::errors::ToExitCode(guard_error.Kind()));
  }

  logger.Debug("check-file complete", {{"checked", std::to_string(options.paths.size())}});
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "check-file") {
    return CommandCheckFile(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace argguard::cli
