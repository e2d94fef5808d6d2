#include "file_event_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "internal/domain/messages.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "planner/v1/state.pb.h"

namespace planner::store {

namespace {

using observability::IntField;
using observability::StringField;

util::StorageFailure ErrnoFailure(const std::string& what, const std::filesystem::path& path) {
  return util::StorageFailure(what + " " + path.string() + ": " + std::strerror(errno));
}

// Owns the log descriptor; closing it releases the flock.
class LockedLog {
 public:
  explicit LockedLog(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw ErrnoFailure("open", path);
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) continue;
      auto error = ErrnoFailure("flock", path);
      ::close(fd_);
      throw error;
    }
  }

  ~LockedLog() {
    ::close(fd_);
  }

  LockedLog(const LockedLog&)            = delete;
  LockedLog& operator=(const LockedLog&) = delete;

  struct stat Stat() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
      throw ErrnoFailure("fstat", path_);
    }
    return st;
  }

  // Cuts a line left without its newline by a writer that died mid-append.
  void DropUnterminatedTail() {
    const off_t size = Stat().st_size;
    if (size == 0) return;

    char  buffer[4096];
    off_t end   = size;
    off_t keep  = 0;
    bool  found = false;
    while (end > 0 && !found) {
      const auto chunk = static_cast<std::size_t>(std::min<off_t>(end, static_cast<off_t>(sizeof(buffer))));
      const auto start = end - static_cast<off_t>(chunk);
      const auto got   = ::pread(fd_, buffer, chunk, start);
      if (got < 0) {
        if (errno == EINTR) continue;
        throw ErrnoFailure("pread", path_);
      }
      if (static_cast<std::size_t>(got) != chunk) {
        throw util::StorageFailure("short read on " + path_.string());
      }
      if (end == size && buffer[got - 1] == '\n') return;
      for (auto i = got; i > 0; --i) {
        if (buffer[i - 1] == '\n') {
          keep  = start + static_cast<off_t>(i);
          found = true;
          break;
        }
      }
      end = start;
    }

    PLANNER_LOG_WARN("Dropping unterminated event log tail",
                     {StringField("path", path_.string()), IntField("bytes", static_cast<std::int64_t>(size - keep))});
    Truncate(keep);
  }

  // All or nothing: a failed write or fsync cuts the log back.
  void Append(const std::string& data) {
    const off_t before    = Stat().st_size;
    const char* ptr       = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
      auto written = ::write(fd_, ptr, remaining);
      if (written < 0) {
        if (errno == EINTR) continue;
        auto error = ErrnoFailure("write", path_);
        RollBack(before);
        throw error;
      }
      ptr += written;
      remaining -= static_cast<std::size_t>(written);
    }
    if (::fsync(fd_) != 0) {
      auto error = ErrnoFailure("fsync", path_);
      RollBack(before);
      throw error;
    }
  }

 private:
  void Truncate(off_t size) {
    if (::ftruncate(fd_, size) != 0 || ::fsync(fd_) != 0) {
      throw ErrnoFailure("ftruncate", path_);
    }
  }

  void RollBack(off_t size) {
    if (::ftruncate(fd_, size) != 0) {
      PLANNER_LOG_ERROR("Event log rollback failed", {StringField("path", path_.string()), StringField("error", std::strerror(errno))});
    }
  }

  std::filesystem::path path_;
  int                   fd_ = -1;
};

} // namespace

FileEventStore::FileEventStore(std::filesystem::path log_path, std::filesystem::path snapshot_path, std::uint32_t snapshot_every)
    : log_path_(std::move(log_path)), snapshot_path_(std::move(snapshot_path)), snapshot_every_(snapshot_every) {
}

std::vector<v1::StoredEvent> FileEventStore::LoadEvents(const std::string& aggregate_id) const {
  std::vector<v1::StoredEvent> events;

  std::error_code ec;
  if (!std::filesystem::exists(log_path_, ec)) {
    return events;
  }

  std::ifstream in(log_path_);
  if (!in) {
    throw util::StorageFailure("cannot open " + log_path_.string());
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    v1::StoredEvent stored;
    try {
      util::FromJson(line, &stored);
    } catch (const std::exception& e) {
      // no newline: an append still in flight or cut short
      if (in.eof()) {
        PLANNER_LOG_WARN("Skipping unterminated event log tail", {StringField("path", log_path_.string()), IntField("line", static_cast<std::int64_t>(line_no))});
        break;
      }
      throw util::StorageFailure(log_path_.string() + ":" + std::to_string(line_no) + ": " + e.what());
    }

    if (stored.aggregate_id() != aggregate_id) continue;

    if (stored.event_version() != domain::kEventVersion) {
      throw util::StorageFailure(log_path_.string() + ":" + std::to_string(line_no) + ": unsupported event_version '" +
                                 stored.event_version() + "'");
    }
    if (stored.event_type() != domain::EventType(stored.payload())) {
      throw util::StorageFailure(log_path_.string() + ":" + std::to_string(line_no) + ": event_type '" + stored.event_type() +
                                 "' does not match payload");
    }
    events.push_back(std::move(stored));
  }
  if (in.bad()) {
    throw util::StorageFailure("read failed on " + log_path_.string());
  }
  return events;
}

AggregateContext FileEventStore::LoadAggregate(const std::string& aggregate_id) const {
  AggregateContext context;

  std::error_code ec;
  if (std::filesystem::exists(snapshot_path_, ec)) {
    try {
      v1::StoredSnapshot snapshot;
      util::FromJson(util::ReadFile(snapshot_path_), &snapshot);
      if (snapshot.aggregate_id() == aggregate_id) {
        context.aggregate        = domain::WorkflowAggregate(snapshot.state());
        context.current_sequence = snapshot.sequence();
      } else {
        PLANNER_LOG_WARN("Ignoring snapshot of another aggregate",
                         {StringField("path", snapshot_path_.string()), StringField("expected", aggregate_id),
                          StringField("found", snapshot.aggregate_id())});
      }
    } catch (const std::exception& e) {
      PLANNER_LOG_WARN("Ignoring unreadable snapshot", {StringField("path", snapshot_path_.string()), StringField("error", e.what())});
    }
  }

  for (const auto& stored : LoadEvents(aggregate_id)) {
    if (stored.sequence() <= context.current_sequence) continue;
    context.aggregate.Apply(stored.payload());
    context.current_sequence = stored.sequence();
  }
  return context;
}

void FileEventStore::ScanTail(std::uint64_t inode, std::uint64_t size) {
  if (inode != scanned_inode_ || size < scanned_bytes_) {
    scanned_inode_ = inode;
    scanned_bytes_ = 0;
    last_sequences_.clear();
  }
  if (size == scanned_bytes_) return;

  std::ifstream in(log_path_, std::ios::binary);
  if (!in) {
    throw util::StorageFailure("cannot open " + log_path_.string());
  }
  in.seekg(static_cast<std::streamoff>(scanned_bytes_));

  std::string line;
  while (scanned_bytes_ < size && std::getline(in, line)) {
    if (in.eof()) break;
    const auto offset = scanned_bytes_;
    scanned_bytes_ += line.size() + 1;
    if (line.empty()) continue;

    v1::StoredEvent stored;
    try {
      util::FromJson(line, &stored);
    } catch (const std::exception& e) {
      scanned_bytes_ = offset;
      throw util::StorageFailure(log_path_.string() + " at byte " + std::to_string(offset) + ": " + e.what());
    }
    auto& last = last_sequences_[stored.aggregate_id()];
    last       = std::max(last, stored.sequence());
  }
  if (in.bad()) {
    throw util::StorageFailure("read failed on " + log_path_.string());
  }
}

std::uint64_t FileEventStore::Commit(const std::string& aggregate_id, AggregateContext* context, const std::vector<v1::WorkflowEvent>& events,
                                     const EventMetadata& metadata) {
  if (events.empty()) {
    return context->current_sequence;
  }

  std::error_code ec;
  if (log_path_.has_parent_path()) {
    std::filesystem::create_directories(log_path_.parent_path(), ec);
    if (ec) {
      throw util::StorageFailure("create_directories " + log_path_.parent_path().string() + ": " + ec.message());
    }
  }

  LockedLog log(log_path_);
  log.DropUnterminatedTail();

  const auto st = log.Stat();
  ScanTail(static_cast<std::uint64_t>(st.st_ino), static_cast<std::uint64_t>(st.st_size));

  const auto it   = last_sequences_.find(aggregate_id);
  const auto last = it == last_sequences_.end() ? std::uint64_t{0} : it->second;
  if (last != context->current_sequence) {
    throw util::ConcurrencyConflict("expected sequence " + std::to_string(context->current_sequence) + " for " + aggregate_id + ", log has " +
                                    std::to_string(last));
  }

  const auto  recorded_at = util::ToProto(util::Now());
  std::string lines;
  auto        sequence = last;
  for (const auto& event : events) {
    v1::StoredEvent stored;
    stored.set_aggregate_id(aggregate_id);
    stored.set_sequence(++sequence);
    *stored.mutable_recorded_at() = recorded_at;
    stored.set_event_type(domain::EventType(event));
    stored.set_event_version(domain::kEventVersion);
    *stored.mutable_payload() = event;
    stored.mutable_metadata()->insert(metadata.begin(), metadata.end());

    try {
      lines += util::ToJson(stored);
    } catch (const std::exception& e) {
      throw util::StorageFailure(e.what());
    }
    lines += '\n';
  }

  log.Append(lines);
  if (scanned_bytes_ == static_cast<std::uint64_t>(st.st_size)) {
    scanned_bytes_ += lines.size();
    last_sequences_[aggregate_id] = sequence;
  }

  // durable: now fold into the caller's context
  bool snapshot_due = false;
  for (const auto& event : events) {
    context->aggregate.Apply(event);
    ++context->current_sequence;
    snapshot_due = snapshot_due || ShouldSnapshot(context->current_sequence, snapshot_every_);
  }

  if (snapshot_due) {
    WriteSnapshot(aggregate_id, *context);
  }
  return context->current_sequence;
}

void FileEventStore::WriteSnapshot(const std::string& aggregate_id, const AggregateContext& context) const {
  v1::StoredSnapshot snapshot;
  snapshot.set_aggregate_id(aggregate_id);
  snapshot.set_sequence(context.current_sequence);
  *snapshot.mutable_snapshot_at() = util::ToProto(util::Now());
  *snapshot.mutable_state()       = context.aggregate.Snapshot();

  try {
    util::WriteFileAtomic(snapshot_path_, util::ToJson(snapshot));
    PLANNER_LOG_DEBUG("Snapshot written", {StringField("aggregate_id", aggregate_id), IntField("sequence", static_cast<std::int64_t>(context.current_sequence))});
  } catch (const std::exception& e) {
    PLANNER_LOG_WARN("Snapshot write failed", {StringField("path", snapshot_path_.string()), StringField("error", e.what())});
  }
}

std::filesystem::path EventLogPath(const std::filesystem::path& data_dir, const std::string& aggregate_id) {
  return data_dir / (aggregate_id + ".events.jsonl");
}

std::filesystem::path SnapshotPath(const std::filesystem::path& data_dir, const std::string& aggregate_id) {
  return data_dir / (aggregate_id + ".snapshot.json");
}

} // namespace planner::store
