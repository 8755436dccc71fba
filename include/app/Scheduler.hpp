#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "util/Clock.hpp"

namespace lanlink::app {

// Single owner of every periodic and one-shot timer. Deadlines are read from
// the injected Clock, so tests drive it with ManualClock + run_due().
class Scheduler {
public:
  using TaskId = uint64_t;
  using Task = std::function<void()>;

  explicit Scheduler(const util::Clock& clock,
                     std::chrono::milliseconds tick = std::chrono::milliseconds(100));
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  TaskId schedule_every(std::string name, std::chrono::milliseconds period, Task fn);
  TaskId schedule_after(std::string name, std::chrono::milliseconds delay, Task fn);
  bool cancel(TaskId id);

  // Runs every task whose deadline has passed, outside the lock. A periodic
  // task that fell behind runs once and is rescheduled from now.
  size_t run_due();

  void start();
  void stop();

  [[nodiscard]] size_t pending() const;
  [[nodiscard]] bool scheduled(TaskId id) const;

private:
  struct Entry {
    TaskId id;
    std::string name;
    util::Clock::time_point due;
    std::chrono::milliseconds period;  // zero for one-shot
    std::shared_ptr<Task> fn;
  };

  void run(std::stop_token st);

  const util::Clock& clock_;
  std::chrono::milliseconds tick_;
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::vector<Entry> entries_;
  TaskId next_id_{1};
  std::jthread thread_{};
};

} // namespace lanlink::app
