#ifndef ARGGUARD_CORE_FS_UTILS_HPP_
#define ARGGUARD_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <system_error>

namespace argguard::core {

// Non-throwing check used by the file guard. Anything that exists and is not a
// directory counts as a file. When the target cannot be resolved (a dangling
// symlink) the link itself is examined, so the link counts as a file.
inline bool IsExistingFile(const std::filesystem::path& path) {
  if (path.empty()) {
    return false;
  }

  std::error_code ec;
  std::filesystem::file_status status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    ec.clear();
    status = std::filesystem::symlink_status(path, ec);
    if (ec) {
      return false;
    }
  }

  return std::filesystem::exists(status) && !std::filesystem::is_directory(status);
}

} // namespace argguard::core

#endif // ARGGUARD_CORE_FS_UTILS_HPP_
