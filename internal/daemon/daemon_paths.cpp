#include "daemon_paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace planner::daemon {

std::filesystem::path DefaultHomeDir() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    throw std::runtime_error("HOME is not set and daemon.home_dir is not configured");
  }
  return std::filesystem::path(home) / ".planning-agent";
}

DaemonPaths ResolvePaths(const planner::runtime::config::RuntimeConfig& config) {
  DaemonPaths paths;
  paths.home = config.daemon().home_dir().empty() ? DefaultHomeDir() : std::filesystem::path(config.daemon().home_dir());
  return paths;
}

std::filesystem::path ResolveDataDir(const planner::runtime::config::RuntimeConfig& config) {
  if (!config.workflow().data_dir().empty()) {
    return config.workflow().data_dir();
  }
  return ResolvePaths(config).SessionsDir();
}

} // namespace planner::daemon
