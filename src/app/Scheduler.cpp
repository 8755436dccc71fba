#include "app/Scheduler.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace lanlink::app {

Scheduler::Scheduler(const util::Clock& clock, std::chrono::milliseconds tick)
    : clock_(clock), tick_(tick) {}

Scheduler::~Scheduler() { stop(); }

Scheduler::TaskId Scheduler::schedule_every(std::string name, std::chrono::milliseconds period, Task fn) {
  if (period.count() <= 0) period = std::chrono::milliseconds(1);
  std::lock_guard<std::mutex> lk(mu_);
  TaskId id = next_id_++;
  entries_.push_back(Entry{id, std::move(name), clock_.now() + period, period,
                           std::make_shared<Task>(std::move(fn))});
  return id;
}

Scheduler::TaskId Scheduler::schedule_after(std::string name, std::chrono::milliseconds delay, Task fn) {
  std::lock_guard<std::mutex> lk(mu_);
  TaskId id = next_id_++;
  entries_.push_back(Entry{id, std::move(name), clock_.now() + delay, std::chrono::milliseconds(0),
                           std::make_shared<Task>(std::move(fn))});
  return id;
}

bool Scheduler::cancel(TaskId id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

size_t Scheduler::run_due() {
  std::vector<std::pair<std::string, std::shared_ptr<Task>>> due;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = clock_.now();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->due > now) { ++it; continue; }
      due.emplace_back(it->name, it->fn);
      if (it->period.count() > 0) {
        it->due = now + it->period;
        ++it;
      } else {
        it = entries_.erase(it);
      }
    }
  }
  for (auto& [name, fn] : due) {
    try {
      (*fn)();
    } catch (const std::exception& e) {
      std::fprintf(stderr, "lanlink: scheduler: task '%s' threw: %s\n", name.c_str(), e.what());
    }
  }
  return due.size();
}

void Scheduler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Scheduler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
  thread_ = std::jthread{};
}

size_t Scheduler::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

bool Scheduler::scheduled(TaskId id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::any_of(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
}

void Scheduler::run(std::stop_token st) {
  while (!st.stop_requested()) {
    (void)run_due();
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, st, tick_, [] { return false; });
  }
}

} // namespace lanlink::app
