#include "file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace planner::util {

namespace {

std::runtime_error ErrnoError(const std::string& what, const std::filesystem::path& path) {
  return std::runtime_error(what + " " + path.string() + ": " + std::strerror(errno));
}

} // namespace

void WriteFileAtomic(const std::filesystem::path& path, const std::string& content, mode_t mode) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  auto tmp_path = path;
  tmp_path += ".tmp";

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd < 0) {
    throw ErrnoError("open", tmp_path);
  }

  const char* data      = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    auto written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      auto error = ErrnoError("write", tmp_path);
      ::close(fd);
      throw error;
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  // umask may have narrowed the requested mode
  if (::fchmod(fd, mode) != 0 || ::fsync(fd) != 0) {
    auto error = ErrnoError("sync", tmp_path);
    ::close(fd);
    throw error;
  }
  ::close(fd);

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    throw std::runtime_error("rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message());
  }
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + path.string());
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace planner::util
