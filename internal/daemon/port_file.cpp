#include "port_file.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"

namespace planner::daemon {

void WritePortFile(const std::filesystem::path& path, const v1::PortFile& port_file) {
  util::WriteFileAtomic(path, util::ToJson(port_file) + "\n", 0600);
}

v1::PortFile ReadPortFile(const std::filesystem::path& path) {
  v1::PortFile port_file;
  util::FromJson(util::ReadFile(path), &port_file);
  return port_file;
}

void WriteTextFile(const std::filesystem::path& path, const std::string& content) {
  util::WriteFileAtomic(path, content + "\n");
}

void RemoveIfExists(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    PLANNER_LOG_WARN("Failed to remove file", {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace planner::daemon
