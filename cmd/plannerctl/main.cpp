#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "client/cpp/daemon_client.h"
#include "internal/actor/workflow_supervisor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/daemon/daemon_paths.hpp"
#include "internal/domain/messages.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/view/workflow_view.hpp"
#include "planner/v1.hpp"

using namespace planner::v1;
using planner::client::DaemonClient;
using planner::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  plannerctl [options] list\n"
            << "  plannerctl [options] heartbeat <session_id>\n"
            << "  plannerctl [options] force-stop <session_id>\n"
            << "  plannerctl [options] shutdown\n"
            << "  plannerctl [options] build-info\n"
            << "  plannerctl [options] request-upgrade <build_timestamp>\n"
            << "  plannerctl [options] files <session_id>\n"
            << "  plannerctl [options] read <session_id> <filename>\n"
            << "  plannerctl [options] workflow <data_dir|-> <workflow_id|new> <command.json>\n"
            << "  plannerctl replay <events.jsonl> <workflow_id>\n"
            << "Options:\n"
            << "  --config <config.yaml>   daemon home, data dir and client timeouts\n"
            << "  --home <dir>             overrides daemon.home_dir\n";
}

static std::uint64_t ParseU64(const std::string& s) {
  try {
    std::size_t pos   = 0;
    auto        value = std::stoull(s, &pos);
    if (pos != s.size()) throw std::invalid_argument(s);
    return value;
  } catch (const std::exception&) {
    std::cerr << "invalid number: '" << s << "'\n";
    std::exit(1);
  }
}

static const char* LivenessName(LivenessState liveness) {
  switch (liveness) {
    case LIVENESS_STATE_RUNNING:
      return "running";
    case LIVENESS_STATE_UNRESPONSIVE:
      return "unresponsive";
    case LIVENESS_STATE_STOPPED:
      return "stopped";
    default:
      return "unknown";
  }
}

static void PrintSession(const SessionRecord& record) {
  std::cout << record.workflow_session_id() << "  " << LivenessName(record.liveness()) << "  pid=" << record.pid()
            << "  feature=" << record.feature_name() << "  phase=" << record.phase() << "  iteration=" << record.iteration()
            << "  status=" << record.workflow_status() << "\n";
}

// ------------------------------------------------------------
// Local workflow commands (no daemon)
// ------------------------------------------------------------

// "-" selects the configured data dir, "new" a fresh workflow id.
static int RunWorkflow(const RuntimeConfig& config, const std::vector<std::string>& args) {
  if (args.size() != 3) {
    Usage();
    return 1;
  }

  WorkflowCommand command;
  planner::util::FromJson(planner::util::ReadFile(args[2]), &command);

  const auto& workflow = config.workflow();

  planner::actor::ActorArgs actor_args;
  actor_args.workflow_id    = args[1] == "new" ? planner::util::NewWorkflowId() : args[1];
  actor_args.data_dir       = args[0] == "-" ? planner::daemon::ResolveDataDir(config) : std::filesystem::path(args[0]);
  actor_args.snapshot_every = workflow.snapshot_every();
  actor_args.events         = std::make_shared<planner::actor::EventStream>(workflow.event_channel_capacity());
  std::filesystem::create_directories(actor_args.data_dir);

  planner::actor::WorkflowSupervisor supervisor;
  supervisor.Spawn(std::move(actor_args));

  try {
    auto view = supervisor.Execute(command);
    std::cout << "workflow_id: " << supervisor.args().workflow_id << "\n" << planner::util::ToJson(view, true) << "\n";
  } catch (const planner::util::WorkflowError& e) {
    supervisor.Stop();
    std::cerr << "command '" << planner::domain::CommandName(command) << "' rejected: " << e.what() << "\n";
    return 1;
  }
  supervisor.Stop();
  return 0;
}

static int RunReplay(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    Usage();
    return 1;
  }

  auto view = planner::view::BootstrapViewFromEvents(args[0], args[1]);
  std::cout << planner::util::ToJson(view, true) << "\n";
  std::cout << "ui_mode: " << planner::view::UiModeName(planner::view::CurrentUiMode(view)) << "\n";
  return 0;
}

// ------------------------------------------------------------
// Daemon commands
// ------------------------------------------------------------

static int RunDaemonCommand(const DaemonClient& client, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "list" && args.empty()) {
    for (const auto& record : client.List()) PrintSession(record);
    return 0;
  }

  if (cmd == "heartbeat" && args.size() == 1) {
    client.Heartbeat(args[0]);
    std::cout << "ok\n";
    return 0;
  }

  if (cmd == "force-stop" && args.size() == 1) {
    client.ForceStop(args[0]);
    std::cout << "stopped " << args[0] << "\n";
    return 0;
  }

  if (cmd == "shutdown" && args.empty()) {
    client.Shutdown();
    std::cout << "shutdown requested\n";
    return 0;
  }

  if (cmd == "build-info" && args.empty()) {
    std::cout << "build_sha: " << client.BuildSha() << "\n"
              << "build_timestamp: " << client.BuildTimestamp() << "\n";
    return 0;
  }

  if (cmd == "request-upgrade" && args.size() == 1) {
    const bool accepted = client.RequestUpgrade(ParseU64(args[0]));
    std::cout << (accepted ? "accepted" : "refused") << "\n";
    return accepted ? 0 : 3;
  }

  if (cmd == "files" && args.size() == 1) {
    for (const auto& entry : client.ListSessionFiles(args[0])) {
      std::cout << (entry.is_dir() ? "d " : "- ") << entry.size() << "\t" << planner::util::ToUnixMillis(planner::util::FromProto(entry.modified_at()))
                << "\t" << entry.name() << "\n";
    }
    return 0;
  }

  if (cmd == "read" && args.size() == 2) {
    auto content = client.ReadSessionFile(args[0], args[1]);
    std::cout << content.content();
    if (content.truncated()) {
      std::cerr << "\n[truncated: " << content.content().size() << " of " << content.total_size() << " bytes]\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> argv_list(argv + 1, argv + argc);

  std::string home;
  std::string config_path;
  while (argv_list.size() >= 2 && (argv_list[0] == "--home" || argv_list[0] == "--config")) {
    (argv_list[0] == "--home" ? home : config_path) = argv_list[1];
    argv_list.erase(argv_list.begin(), argv_list.begin() + 2);
  }
  if (argv_list.empty()) {
    Usage();
    return 1;
  }

  const std::string              cmd = argv_list[0];
  const std::vector<std::string> args(argv_list.begin() + 1, argv_list.end());

  const char* level = std::getenv("PLANNER_LOG_LEVEL");
  planner::observability::InitializeToolLogging(level ? level : "warn");

  try {
    if (cmd == "replay") return RunReplay(args);

    auto config = config_path.empty() ? planner::config::ConfigLoader::Defaults() : planner::config::ConfigLoader::LoadFromYaml(config_path);
    if (!home.empty()) config.mutable_daemon()->set_home_dir(home);

    if (cmd == "workflow") return RunWorkflow(config, args);

    const auto paths   = planner::daemon::ResolvePaths(config);
    const auto timeout = std::chrono::milliseconds(config.client().rpc_timeout_ms());
    auto       client  = DaemonClient::FromPortFile(paths.PortFile(), config.daemon().bind_host(), timeout);
    return RunDaemonCommand(client, cmd, args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
