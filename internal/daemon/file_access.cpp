#include "file_access.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>

#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/time.hpp"

namespace planner::daemon {

namespace fs = std::filesystem;

namespace {

void CheckComponent(const std::string& what, const std::string& name) {
  if (!util::IsSinglePathComponent(name)) {
    throw util::PermissionDenied("invalid " + what + " '" + name + "'");
  }
}

bool IsWithin(const fs::path& root, const fs::path& candidate) {
  auto root_it = root.begin();
  auto cand_it = candidate.begin();
  for (; root_it != root.end(); ++root_it, ++cand_it) {
    if (cand_it == candidate.end() || *root_it != *cand_it) {
      return false;
    }
  }
  return cand_it != candidate.end();
}

google::protobuf::Timestamp ModifiedAt(const fs::directory_entry& entry) {
  std::error_code ec;
  auto            ftime = entry.last_write_time(ec);
  if (ec) {
    return {};
  }
  return util::ToProto(std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ftime)));
}

} // namespace

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto    c     = static_cast<unsigned char>(text[i]);
    std::size_t   extra = 0;
    std::uint32_t cp    = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp    = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp    = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp    = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates and out-of-range values
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::size_t Utf8BoundaryBefore(std::string_view text, std::size_t max_bytes) {
  if (max_bytes >= text.size()) {
    return text.size();
  }
  std::size_t end = max_bytes;
  // back off continuation bytes; the byte at `end` starts the next character
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return end;
}

SessionFileAccess::SessionFileAccess(fs::path sessions_root) : sessions_root_(std::move(sessions_root)) {
}

fs::path SessionFileAccess::SessionDir(const std::string& session_id) const {
  CheckComponent("session id", session_id);

  auto            dir = sessions_root_ / session_id;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw util::SessionNotFound(session_id);
  }
  return dir;
}

std::vector<v1::FileEntry> SessionFileAccess::List(const std::string& session_id) const {
  const auto dir = SessionDir(session_id);

  std::vector<v1::FileEntry> entries;
  std::error_code            ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    v1::FileEntry out;
    out.set_name(entry.path().filename().string());

    std::error_code type_ec;
    out.set_is_dir(entry.is_directory(type_ec));
    if (!out.is_dir()) {
      std::error_code size_ec;
      auto            size = entry.file_size(size_ec);
      out.set_size(size_ec ? 0 : size);
    }
    *out.mutable_modified_at() = ModifiedAt(entry);
    entries.push_back(std::move(out));
  }
  if (ec) {
    throw util::IoError("list " + dir.string() + ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), [](const v1::FileEntry& a, const v1::FileEntry& b) {
    if (a.is_dir() != b.is_dir()) return a.is_dir();
    return a.name() < b.name();
  });
  return entries;
}

v1::FileContent SessionFileAccess::Read(const std::string& session_id, const std::string& filename) const {
  CheckComponent("filename", filename);
  const auto dir = SessionDir(session_id);

  std::error_code ec;
  const auto      canonical_dir = fs::canonical(dir, ec);
  if (ec) {
    throw util::IoError("resolve " + dir.string() + ": " + ec.message());
  }

  const auto path = fs::canonical(dir / filename, ec);
  if (ec) {
    throw util::FileNotFound(filename);
  }
  if (!IsWithin(canonical_dir, path)) {
    throw util::PermissionDenied("'" + filename + "' resolves outside the session directory");
  }
  if (fs::is_directory(path, ec)) {
    throw util::IoError("'" + filename + "' is a directory");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::IoError("open " + filename);
  }

  const auto total_size = fs::file_size(path, ec);
  if (ec) {
    throw util::IoError("stat " + filename + ": " + ec.message());
  }

  // one byte past the cap tells whether the cut lands inside a character
  std::string buffer(std::min<std::uintmax_t>(total_size, kMaxFileReadSize + 1), '\0');
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  buffer.resize(static_cast<std::size_t>(in.gcount()));

  const bool truncated = buffer.size() > kMaxFileReadSize;
  if (truncated) {
    buffer.resize(Utf8BoundaryBefore(buffer, kMaxFileReadSize));
  }
  if (!IsValidUtf8(buffer)) {
    throw util::IoError("'" + filename + "' is not valid UTF-8");
  }

  v1::FileContent content;
  content.set_content(std::move(buffer));
  content.set_truncated(truncated);
  content.set_total_size(total_size);
  return content;
}

} // namespace planner::daemon
