#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "model/Event.hpp"

namespace lanlink::app {

// Broadcast channel without history. publish() only enqueues; a single
// delivery thread runs handlers in subscription order, so every subscriber
// observes the same total order and a publisher never waits on a handler.
// Handlers may publish, subscribe, unsubscribe or issue commands.
class EventChannel {
public:
  using Handler = std::function<void(const model::NetworkEvent&)>;
  using SubscriptionId = uint64_t;

  EventChannel();
  // Delivers what is already queued, then stops the delivery thread.
  ~EventChannel();
  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  SubscriptionId subscribe(Handler handler);
  // Once this returns the handler is not running and will not run again,
  // unless called from the handler itself.
  bool unsubscribe(SubscriptionId id);
  void publish(const model::NetworkEvent& ev);

  // Blocks until everything published before the call has been delivered.
  // Returns at once on the delivery thread.
  void flush();

  [[nodiscard]] bool on_delivery_thread() const;
  [[nodiscard]] size_t subscriber_count() const;
  [[nodiscard]] uint64_t published_count() const;

private:
  struct Subscriber {
    SubscriptionId id;
    Handler handler;
    bool active{true};  // guarded by mu_
  };

  void run(std::stop_token st);

  mutable std::mutex mu_;
  std::condition_variable_any wake_;
  std::condition_variable idle_;
  std::deque<model::NetworkEvent> queue_;
  std::vector<std::shared_ptr<Subscriber>> subs_;
  SubscriptionId next_id_{1};
  SubscriptionId in_flight_{0};
  uint64_t published_{0};
  uint64_t delivered_{0};
  std::thread::id delivery_id_;
  std::jthread worker_;  // last: starts after the state above exists
};

} // namespace lanlink::app
