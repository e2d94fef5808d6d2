#include "subscriber_notifier.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace planner::daemon {

using observability::IntField;
using observability::StringField;

SubscriberNotifier::SubscriberNotifier(std::chrono::milliseconds callback_timeout, std::chrono::seconds ping_interval)
    : callback_timeout_(callback_timeout), ping_interval_(ping_interval) {
}

SubscriberNotifier::~SubscriberNotifier() {
  Stop();
}

void SubscriberNotifier::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&SubscriberNotifier::Loop, this);
}

void SubscriberNotifier::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::uint64_t SubscriberNotifier::Subscribe(const std::string& callback_address) {
  if (callback_address.empty()) {
    throw util::Internal("callback_address must not be empty");
  }

  auto subscriber     = std::make_shared<Subscriber>();
  subscriber->address = callback_address;
  subscriber->stub    = v1::SubscriberCallback::NewStub(::grpc::CreateChannel(callback_address, ::grpc::InsecureChannelCredentials()));

  std::lock_guard lock(mutex_);
  subscriber->id               = next_id_++;
  subscribers_[subscriber->id] = subscriber;

  PLANNER_LOG_INFO("Subscriber added", {IntField("subscriber_id", static_cast<std::int64_t>(subscriber->id)), StringField("address", callback_address)});
  return subscriber->id;
}

void SubscriberNotifier::Unsubscribe(std::uint64_t subscriber_id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(subscriber_id);
}

std::size_t SubscriberNotifier::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

void SubscriberNotifier::Enqueue(Notification notification) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(notification));
  }
  cv_.notify_one();
}

bool SubscriberNotifier::Call(Subscriber& subscriber, const Notification& notification) {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + callback_timeout_);

  ::grpc::Status  status;
  v1::CallbackAck ack;
  if (auto* changed = std::get_if<v1::SessionChangedRequest>(&notification)) {
    status = subscriber.stub->SessionChanged(&context, *changed, &ack);
  } else if (auto* restarting = std::get_if<v1::DaemonRestartingRequest>(&notification)) {
    status = subscriber.stub->DaemonRestarting(&context, *restarting, &ack);
  } else {
    status = subscriber.stub->WorkflowEventReceived(&context, std::get<v1::WorkflowEventRequest>(notification), &ack);
  }

  if (!status.ok()) {
    PLANNER_LOG_WARN("Dropping subscriber after failed callback",
                     {IntField("subscriber_id", static_cast<std::int64_t>(subscriber.id)), StringField("address", subscriber.address),
                      StringField("error", status.error_message())});
  }
  return status.ok();
}

void SubscriberNotifier::Remove(const std::vector<std::uint64_t>& ids) {
  if (ids.empty()) return;
  std::lock_guard lock(mutex_);
  for (auto id : ids) {
    subscribers_.erase(id);
  }
}

void SubscriberNotifier::DeliverNow(const Notification& notification) {
  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, subscriber] : subscribers_) {
      targets.push_back(subscriber);
    }
  }

  std::vector<std::uint64_t> failed;
  for (const auto& subscriber : targets) {
    if (!Call(*subscriber, notification)) {
      failed.push_back(subscriber->id);
    }
  }
  Remove(failed);
}

void SubscriberNotifier::PingAll() {
  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, subscriber] : subscribers_) {
      targets.push_back(subscriber);
    }
  }

  std::vector<std::uint64_t> failed;
  for (const auto& subscriber : targets) {
    ::grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + callback_timeout_);

    v1::PingResponse response;
    auto             status = subscriber->stub->Ping(&context, v1::PingRequest{}, &response);
    if (!status.ok() || !response.healthy()) {
      PLANNER_LOG_WARN("Dropping unhealthy subscriber",
                       {IntField("subscriber_id", static_cast<std::int64_t>(subscriber->id)), StringField("error", status.error_message())});
      failed.push_back(subscriber->id);
    }
  }
  Remove(failed);
}

void SubscriberNotifier::Loop() {
  auto next_ping = std::chrono::steady_clock::now() + ping_interval_;

  std::unique_lock lock(mutex_);
  while (true) {
    cv_.wait_until(lock, next_ping, [&] { return !running_ || !queue_.empty(); });

    // drain before honouring a stop so shutdown notices go out
    while (!queue_.empty()) {
      auto notification = std::move(queue_.front());
      queue_.pop_front();

      lock.unlock();
      DeliverNow(notification);
      lock.lock();
    }

    if (!running_) break;

    if (std::chrono::steady_clock::now() >= next_ping) {
      lock.unlock();
      PingAll();
      lock.lock();
      next_ping = std::chrono::steady_clock::now() + ping_interval_;
    }
  }
}

} // namespace planner::daemon
