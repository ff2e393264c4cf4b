#include "argguard/cli/router.hpp"

int main(int argc, char** argv) {
  return argguard::cli::Dispatch(argc, argv);
}
