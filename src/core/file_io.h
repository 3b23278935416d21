// Directory listing and whole-file reads for descriptor loading.

#ifndef STYLEC_CORE_FILE_IO_H
#define STYLEC_CORE_FILE_IO_H

#include <string>
#include <vector>

#include "core/basic_types.h"

namespace stylec {

/// @brief List the regular files of a directory, sorted by file name.
///
/// Sorting makes track order and channel allocation independent of the
/// file system's enumeration order. Subdirectories are not descended into.
///
/// @param dir Directory path.
/// @param names Receives the file names (not full paths).
/// @param error Receives IoError if the directory cannot be listed.
/// @return True on success.
bool listDirectory(const std::string& dir, std::vector<std::string>& names, CompileError& error);

/// @brief Read a whole file into a string.
/// @param path File path.
/// @param text Receives the file contents.
/// @param error Receives IoError on failure.
/// @return True on success.
bool readTextFile(const std::string& path, std::string& text, CompileError& error);

/// @brief Write a string to a file, replacing any existing content.
/// @return True if every byte was written.
bool writeTextFile(const std::string& path, const std::string& text);

/// @brief Join a directory and a file name.
std::string joinPath(const std::string& dir, const std::string& name);

/// @brief File name without directory and without its last extension
///        ("dir/drums.json" -> "drums").
std::string fileStem(const std::string& path);

}  // namespace stylec

#endif  // STYLEC_CORE_FILE_IO_H
