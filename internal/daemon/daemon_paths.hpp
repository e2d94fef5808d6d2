#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace planner::daemon {

/*
  Well-known files under the daemon home directory.

      <home>/sessiond.port               {port, subscriber_port, token}
      <home>/sessiond.pid
      <home>/sessiond.sha
      <home>/sessiond-registry.json
      <home>/sessions/<session_id>/      per-session files
*/
struct DaemonPaths {
  std::filesystem::path home;

  std::filesystem::path PortFile() const {
    return home / "sessiond.port";
  }
  std::filesystem::path PidFile() const {
    return home / "sessiond.pid";
  }
  std::filesystem::path ShaFile() const {
    return home / "sessiond.sha";
  }
  std::filesystem::path RegistryFile() const {
    return home / "sessiond-registry.json";
  }
  std::filesystem::path SessionsDir() const {
    return home / "sessions";
  }
};

// daemon.home_dir, else $HOME/.planning-agent. Throws if neither is known.
DaemonPaths ResolvePaths(const planner::runtime::config::RuntimeConfig& config);

std::filesystem::path DefaultHomeDir();

// workflow.data_dir, else <home>/sessions.
std::filesystem::path ResolveDataDir(const planner::runtime::config::RuntimeConfig& config);

} // namespace planner::daemon
