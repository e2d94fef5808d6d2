#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace planner::view {

/*
  Bounded fan-out channel.

  Every subscriber owns a queue of `capacity` entries. Publish never
  blocks: a full queue drops its oldest entry and the subscriber's lag
  counter records how many were lost. Subscriptions are held weakly and
  pruned once their owner releases them.
*/
template <typename T>
class Broadcast {
 public:
  class Subscription {
   public:
    explicit Subscription(std::size_t capacity) : capacity_(capacity) {
    }

    std::optional<T> TryNext() {
      std::lock_guard lock(mutex_);
      return PopLocked();
    }

    std::optional<T> Next(std::chrono::milliseconds timeout) {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, timeout, [&] { return !queue_.empty(); });
      return PopLocked();
    }

    std::uint64_t Lagged() const {
      std::lock_guard lock(mutex_);
      return lagged_;
    }

    void Push(const T& value) {
      {
        std::lock_guard lock(mutex_);
        if (queue_.size() >= capacity_) {
          queue_.pop_front();
          ++lagged_;
        }
        queue_.push_back(value);
      }
      cv_.notify_one();
    }

   private:
    std::optional<T> PopLocked() {
      if (queue_.empty()) return std::nullopt;
      T value = std::move(queue_.front());
      queue_.pop_front();
      return value;
    }

    std::size_t             capacity_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<T>           queue_;
    std::uint64_t           lagged_ = 0;
  };

  explicit Broadcast(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  std::shared_ptr<Subscription> Subscribe() {
    auto subscription = std::make_shared<Subscription>(capacity_);
    std::lock_guard lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
  }

  void Publish(const T& value) {
    std::lock_guard lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
      if (auto subscription = it->lock()) {
        subscription->Push(value);
        ++it;
      } else {
        it = subscribers_.erase(it);
      }
    }
  }

  std::size_t SubscriberCount() {
    std::lock_guard lock(mutex_);
    std::size_t     count = 0;
    for (const auto& weak : subscribers_) {
      if (!weak.expired()) ++count;
    }
    return count;
  }

 private:
  std::size_t                              capacity_;
  std::mutex                               mutex_;
  std::vector<std::weak_ptr<Subscription>> subscribers_;
};

} // namespace planner::view
