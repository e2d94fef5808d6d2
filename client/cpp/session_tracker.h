#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "daemon_client.h"

namespace planner::client {

/*
  SessionTracker

  Keeps this process's sessions registered with the daemon. A background
  thread heartbeats every active session; after two consecutive failed
  rounds it reconnects through the port file and re-registers everything
  it tracks, backing off up to one minute while the daemon is away. A
  session the daemon no longer knows as live is registered again at once.
*/
class SessionTracker {
 public:
  SessionTracker(std::filesystem::path port_file, std::chrono::milliseconds rpc_timeout, std::chrono::milliseconds heartbeat_interval);
  ~SessionTracker();

  SessionTracker(const SessionTracker&)            = delete;
  SessionTracker& operator=(const SessionTracker&) = delete;

  void Start();
  void Stop();

  // Fills pid and timestamps, registers with the daemon and starts tracking.
  void Register(v1::SessionRecord record);

  void Update(const std::string& session_id, const std::string& phase, std::uint32_t iteration, const std::string& workflow_status);

  // Reports the session as Stopped and stops heartbeating it.
  void MarkStopped(const std::string& session_id);

  void PublishWorkflowEvent(const std::string& session_id, const v1::WorkflowEventEnvelope& envelope);

  std::size_t ActiveCount() const;

 private:
  void                          Loop();
  void                          HeartbeatRound();
  bool                          Reregister(const std::string& session_id);
  std::shared_ptr<DaemonClient> Client();
  void                          Reconnect();

  std::filesystem::path     port_file_;
  std::chrono::milliseconds rpc_timeout_;
  std::chrono::milliseconds heartbeat_interval_;

  mutable std::mutex                       mutex_;
  std::condition_variable                  cv_;
  std::map<std::string, v1::SessionRecord> sessions_;
  std::shared_ptr<DaemonClient>            client_;
  bool                                     running_ = false;
  std::thread                              thread_;

  std::uint32_t             consecutive_failures_ = 0;
  std::chrono::milliseconds backoff_{0};
};

} // namespace planner::client
