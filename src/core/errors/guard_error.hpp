#ifndef ARGGUARD_CORE_ERRORS_GUARD_ERROR_HPP_
#define ARGGUARD_CORE_ERRORS_GUARD_ERROR_HPP_

#include <stdexcept>
#include <string>
#include <string_view>

namespace argguard::core::errors {

// Failure classes raised by guards. Each guard raises exactly one kind for a
// given violation so callers (and the CLI exit-code mapping) can branch on
// `Kind()` without parsing message text.
enum class FailureKind {
  kNullArgument,
  kInvalidArgument,
  kInvalidState,
};

const char* ToString(FailureKind kind);

inline constexpr std::string_view kValueCannotBeNull = "Value cannot be null.";

// Appends " (Parameter '<name>')" when a parameter name is known.
std::string ComposeMessage(std::string_view message, std::string_view param_name);

class GuardError : public std::logic_error {
public:
  FailureKind Kind() const noexcept {
    return kind_;
  }

  // Message as supplied by the guard, without the parameter suffix.
  const std::string& Message() const noexcept {
    return message_;
  }

  const std::string& ParamName() const noexcept {
    return param_name_;
  }

protected:
  GuardError(FailureKind kind, std::string message, std::string_view param_name);

private:
  FailureKind kind_;
  std::string message_;
  std::string param_name_;
};

// A value was present but violated a structural constraint.
class ArgumentError : public GuardError {
public:
  explicit ArgumentError(std::string message, std::string_view param_name = {});

protected:
  ArgumentError(FailureKind kind, std::string message, std::string_view param_name);
};

// A required value was absent. Derives from ArgumentError so handlers for
// argument failures in general also see null arguments.
class ArgumentNullError : public ArgumentError {
public:
  explicit ArgumentNullError(std::string_view param_name = {});
  ArgumentNullError(std::string_view param_name, std::string message);
};

// A value was absent where that means internal invariants are broken rather
// than a caller mistake.
class InvalidStateError : public GuardError {
public:
  explicit InvalidStateError(std::string message);
};

} // namespace argguard::core::errors

#endif // ARGGUARD_CORE_ERRORS_GUARD_ERROR_HPP_
