#include "core/errors/exit_codes.hpp"
#include "core/errors/guard_error.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace argguard::core::errors;

TEST_CASE("ComposeMessage appends the parameter name only when known", "[core][errors]") {
  CHECK(ComposeMessage("Argument was empty", "ids") == "Argument was empty (Parameter 'ids')");
  CHECK(ComposeMessage("Argument was empty", "") == "Argument was empty");
}

TEST_CASE("guard errors keep kind, message and parameter separately", "[core][errors]") {
  const ArgumentError invalid("File not found: a.json", "path");
  CHECK(invalid.Kind() == FailureKind::kInvalidArgument);
  CHECK(invalid.Message() == "File not found: a.json");
  CHECK(invalid.ParamName() == "path");
  CHECK(std::string(invalid.what()) == "File not found: a.json (Parameter 'path')");

  const ArgumentNullError null_default("widget");
  CHECK(null_default.Kind() == FailureKind::kNullArgument);
  CHECK(null_default.Message() == std::string(kValueCannotBeNull));

  const ArgumentNullError null_custom("widget", "widget must be attached");
  CHECK(null_custom.Message() == "widget must be attached");

  const InvalidStateError state("runner already stopped");
  CHECK(state.Kind() == FailureKind::kInvalidState);
  CHECK(state.ParamName().empty());
  CHECK(std::string(state.what()) == "runner already stopped");
}

TEST_CASE("guard errors are logic errors", "[core][errors]") {
  try {
    throw ArgumentNullError("session");
  } catch (const std::logic_error& error) {
    CHECK(std::string(error.what()) == "Value cannot be null. (Parameter 'session')");
  }
}

TEST_CASE("failure kinds have stable names and exit codes", "[core][errors]") {
  CHECK(std::string(ToString(FailureKind::kNullArgument)) == "null_argument");
  CHECK(std::string(ToString(FailureKind::kInvalidArgument)) == "invalid_argument");
  CHECK(std::string(ToString(FailureKind::kInvalidState)) == "invalid_state");

  STATIC_REQUIRE(ToInt(ToExitCode(FailureKind::kNullArgument)) == 10);
  STATIC_REQUIRE(ToInt(ToExitCode(FailureKind::kInvalidArgument)) == 11);
  STATIC_REQUIRE(ToInt(ToExitCode(FailureKind::kInvalidState)) == 12);
  STATIC_REQUIRE(ToInt(ExitCode::kUsage) == 2);
}
