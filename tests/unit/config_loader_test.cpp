#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "planner_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
daemon:
  bind_host: "127.0.0.1"
  port: 7400
  home_dir: "/tmp/planner home"
  unresponsive_timeout_secs: 10
  stale_timeout_secs: 30
  upstream:
    port: 17717
    max_backoff_ms: 30000
workflow:
  data_dir: /var/lib/planner
  snapshot_every: 0
  failure_policy:
    max_retries: 4
    on_all_reviewers_failed: ALL_REVIEWERS_FAILED_ACTION_CONTINUE_WITHOUT_REVIEW
client:
  heartbeat_interval_secs: 2
)");

  auto config = planner::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.daemon().port() == 7400);
  assert(config.daemon().home_dir() == "/tmp/planner home");
  assert(config.daemon().unresponsive_timeout_secs() == 10);
  assert(config.daemon().stale_timeout_secs() == 30);
  assert(config.daemon().upstream().port() == 17717);
  assert(config.daemon().upstream().host() == "auto");
  assert(config.daemon().upstream().max_backoff_ms() == 30000);
  assert(config.daemon().upstream().initial_backoff_ms() == 5000);
  assert(config.workflow().data_dir() == "/var/lib/planner");

  // an explicit zero disables snapshots rather than taking the default
  assert(config.workflow().has_snapshot_every());
  assert(config.workflow().snapshot_every() == 0);

  assert(config.workflow().failure_policy().max_retries() == 4);
  assert(config.workflow().failure_policy().backoff_secs() == 5);
  assert(config.workflow().failure_policy().on_all_reviewers_failed() ==
         planner::v1::ALL_REVIEWERS_FAILED_ACTION_CONTINUE_WITHOUT_REVIEW);
  assert(config.client().heartbeat_interval_secs() == 2);
  assert(config.client().rpc_timeout_ms() == 5000);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted", R"(logging:
  level: "1"
  pattern: "[%H:%M:%S] %v"
)");

  auto config = planner::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "1");
  assert(config.logging().pattern() == "[%H:%M:%S] %v");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(daemon:
  port: 7400
  prot: 7401
)");

  bool threw = false;
  try {
    (void)planner::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Invalid configuration") != std::string::npos;
  }
  assert(threw && "misspelled keys must not be ignored");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)planner::config::ConfigLoader::LoadFromYaml("/nonexistent/planner/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");
  const auto config    = planner::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto defaults  = planner::config::ConfigLoader::Defaults();

  assert(config.daemon().bind_host() == "127.0.0.1");
  assert(config.daemon().port() == 0);
  assert(config.daemon().unresponsive_timeout_secs() == 25);
  assert(config.daemon().stale_timeout_secs() == 60);
  assert(config.daemon().upstream().port() == 0);
  assert(config.daemon().upstream().heartbeat_interval_secs() == 30);
  assert(config.workflow().snapshot_every() == 50);
  assert(config.workflow().event_channel_capacity() == 64);
  assert(config.workflow().failure_policy().max_retries() == 2);
  assert(config.SerializeAsString() == defaults.SerializeAsString());
}

void TestApplyDefaultsIsIdempotent() {
  auto config = planner::config::ConfigLoader::Defaults();
  config.mutable_daemon()->set_sweep_interval_ms(250);

  const auto before = config.SerializeAsString();
  planner::config::ApplyDefaults(&config);
  assert(config.SerializeAsString() == before);
  assert(config.daemon().sweep_interval_ms() == 250);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEmptyFileYieldsDefaults();
  TestApplyDefaultsIsIdempotent();

  std::cout << "planner_unit_config_loader: pass\n";
  return 0;
}
