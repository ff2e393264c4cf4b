#ifndef ARGGUARD_TESTS_COMMON_TEMP_DIR_HPP_
#define ARGGUARD_TESTS_COMMON_TEMP_DIR_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace argguard::tests::common {

// Scratch directory removed on scope exit. Usable from both Catch2 tests and
// abort-style smoke tests, so failures surface as exceptions.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) : root_(BuildUniquePath(prefix)) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
    if (ec) {
      throw std::runtime_error("failed to create temp root: " + root_.string());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& Path() const {
    return root_;
  }

  // Creates (or truncates) `relative` under the root with `contents`.
  std::filesystem::path WriteFile(const std::filesystem::path& relative,
                                  std::string_view contents = "x") const {
    const std::filesystem::path target = root_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("failed to create directory '" + target.parent_path().string() +
                               "': " + ec.message());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to create file: " + target.string());
    }
    out << contents;
    if (!out) {
      throw std::runtime_error("failed while writing file: " + target.string());
    }
    return target;
  }

private:
  static std::filesystem::path BuildUniquePath(std::string_view prefix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    return std::filesystem::temp_directory_path() /
           (std::string(prefix) + "-" + std::to_string(now_ms) + "-" +
            std::to_string(counter.fetch_add(1U, std::memory_order_relaxed)));
  }

  std::filesystem::path root_;
};

} // namespace argguard::tests::common

#endif // ARGGUARD_TESTS_COMMON_TEMP_DIR_HPP_
