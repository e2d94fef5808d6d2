#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "internal/domain/workflow_aggregate.hpp"
#include "planner/v1/events.pb.h"

namespace planner::store {

// Aggregate plus the sequence of the last event folded into it.
struct AggregateContext {
  domain::WorkflowAggregate aggregate;
  std::uint64_t             current_sequence = 0;
};

using EventMetadata = std::map<std::string, std::string>;

/*
  Append-only JSONL event log with optional snapshots.

      <data_dir>/<id>.events.jsonl    one StoredEvent per line
      <data_dir>/<id>.snapshot.json   StoredSnapshot

  Commits take an exclusive flock on the log and check the last stored
  sequence against the caller's context, so two stores sharing a log
  detect each other instead of interleaving. The last sequence per
  aggregate is cached; a commit only reads what other writers appended
  since. A commit that fails mid-write leaves no partial line behind.

  All I/O failures surface as util::StorageFailure.
*/
class FileEventStore {
 public:
  FileEventStore(std::filesystem::path log_path, std::filesystem::path snapshot_path, std::uint32_t snapshot_every);

  std::vector<v1::StoredEvent> LoadEvents(const std::string& aggregate_id) const;

  AggregateContext LoadAggregate(const std::string& aggregate_id) const;

  // Appends `events` with consecutive sequences, then folds them into
  // `context`. Returns the new current sequence.
  std::uint64_t Commit(const std::string& aggregate_id, AggregateContext* context, const std::vector<v1::WorkflowEvent>& events,
                       const EventMetadata& metadata = {});

  const std::filesystem::path& log_path() const {
    return log_path_;
  }
  const std::filesystem::path& snapshot_path() const {
    return snapshot_path_;
  }

 private:
  // Folds log lines past scanned_bytes_ into last_sequences_. Caller holds the flock.
  void ScanTail(std::uint64_t inode, std::uint64_t size);
  void WriteSnapshot(const std::string& aggregate_id, const AggregateContext& context) const;

  std::filesystem::path log_path_;
  std::filesystem::path snapshot_path_;
  std::uint32_t         snapshot_every_;

  std::uint64_t                        scanned_inode_ = 0;
  std::uint64_t                        scanned_bytes_ = 0;
  std::map<std::string, std::uint64_t> last_sequences_;
};

std::filesystem::path EventLogPath(const std::filesystem::path& data_dir, const std::string& aggregate_id);
std::filesystem::path SnapshotPath(const std::filesystem::path& data_dir, const std::string& aggregate_id);

constexpr bool ShouldSnapshot(std::uint64_t sequence, std::uint32_t every_n) {
  return every_n > 0 && sequence % every_n == 0;
}

} // namespace planner::store
