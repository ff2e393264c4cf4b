#pragma once

#include "core/errors/guard_error.hpp"

namespace argguard::core::errors {

// Stable process-exit contract for the `argguard` CLI.
//
// The first three values keep their conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Guard failures get one code per FailureKind so wrappers can branch without
// scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kNullArgument = 10,
  kInvalidArgument = 11,
  kInvalidState = 12,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

constexpr ExitCode ToExitCode(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNullArgument:
    return ExitCode::kNullArgument;
  case FailureKind::kInvalidArgument:
    return ExitCode::kInvalidArgument;
  case FailureKind::kInvalidState:
    return ExitCode::kInvalidState;
  }

  return ExitCode::kFailure;
}

} // namespace argguard::core::errors
