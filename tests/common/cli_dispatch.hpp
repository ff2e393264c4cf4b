#ifndef ARGGUARD_TESTS_COMMON_CLI_DISPATCH_HPP_
#define ARGGUARD_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "argguard/cli/router.hpp"

#include <iostream>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace argguard::tests::common {

// Points `stream` at `target` until scope exit, also when unwinding.
class ScopedStreamRedirect {
public:
  ScopedStreamRedirect(std::ostream& stream, std::streambuf* target)
      : stream_(stream), original_(stream.rdbuf(target)) {}

  ~ScopedStreamRedirect() {
    stream_.rdbuf(original_);
  }

  ScopedStreamRedirect(const ScopedStreamRedirect&) = delete;
  ScopedStreamRedirect& operator=(const ScopedStreamRedirect&) = delete;

private:
  std::ostream& stream_;
  std::streambuf* original_;
};

struct DispatchResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs `argguard <args...>` in-process with stdout/stderr captured.
inline DispatchResult DispatchCaptured(std::vector<std::string> argv_storage) {
  argv_storage.insert(argv_storage.begin(), "argguard");

  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  int exit_code = 0;
  {
    const ScopedStreamRedirect redirect_out(std::cout, captured_out.rdbuf());
    const ScopedStreamRedirect redirect_err(std::cerr, captured_err.rdbuf());
    exit_code = argguard::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  }

  return DispatchResult{
      .exit_code = exit_code,
      .stdout_text = captured_out.str(),
      .stderr_text = captured_err.str(),
  };
}

} // namespace argguard::tests::common

#endif // ARGGUARD_TESTS_COMMON_CLI_DISPATCH_HPP_
