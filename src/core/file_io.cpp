/// @file
/// @brief Directory listing and file read/write helpers.

#include "core/file_io.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace stylec {

namespace fs = std::filesystem;

bool listDirectory(const std::string& dir, std::vector<std::string>& names, CompileError& error) {
  names.clear();

  std::error_code ec;
  fs::directory_iterator iter(dir, ec);
  if (ec) {
    return fail(error, ErrorKind::IoError,
                "Failed to list directory: " + dir + " (" + ec.message() + ")");
  }

  fs::directory_iterator end;
  for (; iter != end; iter.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (iter->is_regular_file(type_ec)) {
      names.push_back(iter->path().filename().string());
    }
  }
  if (ec) {
    return fail(error, ErrorKind::IoError,
                "Failed while listing directory: " + dir + " (" + ec.message() + ")");
  }

  std::sort(names.begin(), names.end());
  return true;
}

bool readTextFile(const std::string& path, std::string& text, CompileError& error) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    return fail(error, ErrorKind::IoError, "Failed to open file: " + path);
  }

  text.clear();
  char buffer[4096];
  size_t bytes_read = 0;
  while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    text.append(buffer, bytes_read);
  }
  bool read_error = std::ferror(file) != 0;
  std::fclose(file);

  if (read_error) {
    return fail(error, ErrorKind::IoError, "Failed to read complete file: " + path);
  }
  return true;
}

bool writeTextFile(const std::string& path, const std::string& text) {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(text.data(), 1, text.size(), file);
  bool close_ok = std::fclose(file) == 0;
  return written == text.size() && close_ok;
}

std::string joinPath(const std::string& dir, const std::string& name) {
  return (fs::path(dir) / name).string();
}

std::string fileStem(const std::string& path) {
  return fs::path(path).stem().string();
}

}  // namespace stylec
