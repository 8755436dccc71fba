#include "app/EventChannel.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace lanlink::app {

EventChannel::EventChannel() : worker_([this](std::stop_token st) { run(st); }) {}

EventChannel::~EventChannel() {
  worker_.request_stop();
  if (worker_.joinable()) worker_.join();
}

EventChannel::SubscriptionId EventChannel::subscribe(Handler handler) {
  auto sub = std::make_shared<Subscriber>();
  sub->handler = std::move(handler);
  std::lock_guard<std::mutex> lk(mu_);
  sub->id = next_id_++;
  subs_.push_back(sub);
  return sub->id;
}

bool EventChannel::unsubscribe(SubscriptionId id) {
  std::unique_lock<std::mutex> lk(mu_);
  auto it = std::find_if(subs_.begin(), subs_.end(), [id](const auto& s) { return s->id == id; });
  if (it == subs_.end()) return false;
  (*it)->active = false;
  subs_.erase(it);
  if (std::this_thread::get_id() != delivery_id_) idle_.wait(lk, [&] { return in_flight_ != id; });
  return true;
}

void EventChannel::publish(const model::NetworkEvent& ev) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(ev);
    ++published_;
  }
  wake_.notify_one();
}

void EventChannel::flush() {
  std::unique_lock<std::mutex> lk(mu_);
  if (std::this_thread::get_id() == delivery_id_) return;
  uint64_t target = published_;
  idle_.wait(lk, [&] { return delivered_ >= target; });
}

bool EventChannel::on_delivery_thread() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::this_thread::get_id() == delivery_id_;
}

size_t EventChannel::subscriber_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return subs_.size();
}

uint64_t EventChannel::published_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return published_;
}

void EventChannel::run(std::stop_token st) {
  std::unique_lock<std::mutex> lk(mu_);
  delivery_id_ = std::this_thread::get_id();
  for (;;) {
    // After a stop request the queue is still drained before exiting.
    wake_.wait(lk, st, [this] { return !queue_.empty(); });
    if (queue_.empty()) break;
    model::NetworkEvent ev = std::move(queue_.front());
    queue_.pop_front();
    auto snapshot = subs_;
    for (const auto& sub : snapshot) {
      if (!sub->active) continue;
      in_flight_ = sub->id;
      lk.unlock();
      try {
        sub->handler(ev);
      } catch (const std::exception& e) {
        std::fprintf(stderr, "lanlink: events: subscriber %llu threw on %s: %s\n",
                     static_cast<unsigned long long>(sub->id), model::event_name(ev), e.what());
      }
      lk.lock();
      in_flight_ = 0;
      idle_.notify_all();
    }
    ++delivered_;
    idle_.notify_all();
  }
  delivery_id_ = std::thread::id();
}

} // namespace lanlink::app
