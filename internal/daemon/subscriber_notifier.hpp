#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "planner/v1/daemon_service.grpc.pb.h"

namespace planner::daemon {

/*
  SubscriberNotifier

  Fans daemon notifications out to subscriber callback servers. Delivery
  happens on a dedicated worker so registry mutations never wait on a
  subscriber. Every call carries a deadline; a subscriber whose call
  fails is dropped. Idle subscribers are pinged periodically.
*/
class SubscriberNotifier {
 public:
  using Notification = std::variant<v1::SessionChangedRequest, v1::DaemonRestartingRequest, v1::WorkflowEventRequest>;

  SubscriberNotifier(std::chrono::milliseconds callback_timeout, std::chrono::seconds ping_interval);
  ~SubscriberNotifier();

  SubscriberNotifier(const SubscriberNotifier&)            = delete;
  SubscriberNotifier& operator=(const SubscriberNotifier&) = delete;

  void Start();
  // Delivers what is queued, then stops the worker.
  void Stop();

  std::uint64_t Subscribe(const std::string& callback_address);
  void          Unsubscribe(std::uint64_t subscriber_id);
  std::size_t   SubscriberCount() const;

  void Enqueue(Notification notification);

  // Synchronous delivery, used right before the daemon goes away.
  void DeliverNow(const Notification& notification);

  void PingAll();

 private:
  struct Subscriber {
    std::uint64_t                                 id = 0;
    std::string                                   address;
    std::unique_ptr<v1::SubscriberCallback::Stub> stub;
  };

  void Loop();
  bool Call(Subscriber& subscriber, const Notification& notification);
  void Remove(const std::vector<std::uint64_t>& ids);

  std::chrono::milliseconds callback_timeout_;
  std::chrono::seconds      ping_interval_;

  mutable std::mutex                                   mutex_;
  std::condition_variable                              cv_;
  std::map<std::uint64_t, std::shared_ptr<Subscriber>> subscribers_;
  std::deque<Notification>                             queue_;
  std::uint64_t                                        next_id_ = 1;
  bool                                                 running_ = false;
  std::thread                                          thread_;
};

} // namespace planner::daemon
