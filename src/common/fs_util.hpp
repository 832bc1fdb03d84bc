#pragma once

#include <string>

namespace gattbench {

// Create a directory and its parents (mkdir -p). Returns false if the final
// directory does not exist afterwards.
bool ensureDirectory(const std::string& dir);

// Parent directories of a file path
bool ensureParentDirectory(const std::string& file_path);

bool fileExists(const std::string& path);

std::string joinPath(const std::string& dir, const std::string& name);

// Write to <path>.tmp, fsync, rename over <path>. A reader never sees a
// half-written file. Returns false (and leaves <path> untouched) on failure.
bool writeFileAtomic(const std::string& path, const std::string& content);

// Expand a leading "~/" using $HOME
std::string expandHome(const std::string& path);

} // namespace gattbench
