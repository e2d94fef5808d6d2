#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "planner/v1/session.pb.h"

namespace planner::daemon {

constexpr std::size_t kMaxFileReadSize = 1048576;

/*
  Read-only access to files under <sessions_root>/<session_id>.

  Names are validated as single path components before the filesystem is
  touched; the resolved path must still canonicalise inside the session
  directory, which also defeats symlinks pointing elsewhere.
*/
class SessionFileAccess {
 public:
  explicit SessionFileAccess(std::filesystem::path sessions_root);

  // Directories first, then by name.
  std::vector<v1::FileEntry> List(const std::string& session_id) const;

  v1::FileContent Read(const std::string& session_id, const std::string& filename) const;

 private:
  std::filesystem::path SessionDir(const std::string& session_id) const;

  std::filesystem::path sessions_root_;
};

bool IsValidUtf8(std::string_view text);

// Longest prefix of `text` (at most `max_bytes`) ending on a code point boundary.
std::size_t Utf8BoundaryBefore(std::string_view text, std::size_t max_bytes);

} // namespace planner::daemon
