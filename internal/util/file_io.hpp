#pragma once

#include <filesystem>
#include <string>

#include <sys/types.h>

namespace planner::util {

/*
  Atomic write:
      write tmp → fsync → rename

  Parent directories are created. Throws std::runtime_error on failure.
*/
void WriteFileAtomic(const std::filesystem::path& path, const std::string& content, mode_t mode = 0644);

// Whole file as bytes. Throws std::runtime_error if it cannot be opened.
std::string ReadFile(const std::filesystem::path& path);

} // namespace planner::util
