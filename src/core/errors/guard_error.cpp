#include "core/errors/guard_error.hpp"

#include <utility>

namespace argguard::core::errors {

const char* ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNullArgument:
    return "null_argument";
  case FailureKind::kInvalidArgument:
    return "invalid_argument";
  case FailureKind::kInvalidState:
    return "invalid_state";
  }

  return "invalid_argument";
}

std::string ComposeMessage(std::string_view message, std::string_view param_name) {
  std::string composed(message);
  if (!param_name.empty()) {
    composed += " (Parameter '";
    composed += param_name;
    composed += "')";
  }
  return composed;
}

GuardError::GuardError(FailureKind kind, std::string message, std::string_view param_name)
    : std::logic_error(ComposeMessage(message, param_name)),
      kind_(kind),
      message_(std::move(message)),
      param_name_(param_name) {}

ArgumentError::ArgumentError(std::string message, std::string_view param_name)
    : GuardError(FailureKind::kInvalidArgument, std::move(message), param_name) {}

ArgumentError::ArgumentError(FailureKind kind, std::string message, std::string_view param_name)
    : GuardError(kind, std::move(message), param_name) {}

ArgumentNullError::ArgumentNullError(std::string_view param_name)
    : ArgumentError(FailureKind::kNullArgument, std::string(kValueCannotBeNull), param_name) {}

ArgumentNullError::ArgumentNullError(std::string_view param_name, std::string message)
    : ArgumentError(FailureKind::kNullArgument, std::move(message), param_name) {}

InvalidStateError::InvalidStateError(std::string message)
    : GuardError(FailureKind::kInvalidState, std::move(message), {}) {}

} // namespace argguard::core::errors
