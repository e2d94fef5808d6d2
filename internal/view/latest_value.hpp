#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace planner::view {

/*
  Single-slot "latest value" channel.

  Publish overwrites; readers never see a backlog, only the newest value
  and a version that increases with every publish.
*/
template <typename T>
class LatestValue {
 public:
  explicit LatestValue(T initial = T{}) : value_(std::move(initial)) {
  }

  std::uint64_t Publish(T value) {
    std::uint64_t version;
    {
      std::lock_guard lock(mutex_);
      value_  = std::move(value);
      version = ++version_;
    }
    cv_.notify_all();
    return version;
  }

  T Get() const {
    std::lock_guard lock(mutex_);
    return value_;
  }

  std::uint64_t Version() const {
    std::lock_guard lock(mutex_);
    return version_;
  }

  // Newest value once the version passes `since`, nullopt on timeout.
  std::optional<std::pair<T, std::uint64_t>> WaitForChange(std::uint64_t since, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return version_ > since; })) {
      return std::nullopt;
    }
    return std::make_pair(value_, version_);
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  T                               value_;
  std::uint64_t                   version_ = 0;
};

} // namespace planner::view
