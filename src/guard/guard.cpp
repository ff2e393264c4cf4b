#include "guard/guard.hpp"

#include "core/fs_utils.hpp"

namespace argguard::guard {

namespace {

std::string FileNotFoundMessage(std::string_view file_name) {
  return "File not found: " + std::string(file_name);
}

} // namespace

void ArgumentValid(std::string_view message, bool test, std::string_view arg_name) {
  if (!test) {
    throw ArgumentError(std::string(message), arg_name);
  }
}

const char* FileExists(const char* file_name, std::string_view arg_name) {
  ArgumentNotNullOrEmpty(file_name, arg_name);
  if (!core::IsExistingFile(file_name)) {
    throw ArgumentError(FileNotFoundMessage(file_name), arg_name);
  }

  return file_name;
}

std::string_view FileExists(std::string_view file_name, std::string_view arg_name) {
  ArgumentNotNullOrEmpty(file_name, arg_name);
  if (!core::IsExistingFile(std::filesystem::path(file_name))) {
    throw ArgumentError(FileNotFoundMessage(file_name), arg_name);
  }

  return file_name;
}

std::string FileExists(std::string file_name, std::string_view arg_name) {
  ArgumentNotNullOrEmpty(file_name, arg_name);
  if (!core::IsExistingFile(file_name)) {
    throw ArgumentError(FileNotFoundMessage(file_name), arg_name);
  }

  return file_name;
}

std::filesystem::path FileExists(std::filesystem::path file_name, std::string_view arg_name) {
  if (file_name.empty()) {
    throw ArgumentError(std::string(kArgumentWasEmpty), arg_name);
  }
  if (!core::IsExistingFile(file_name)) {
    throw ArgumentError(FileNotFoundMessage(file_name.string()), arg_name);
  }

  return file_name;
}

} // namespace argguard::guard
