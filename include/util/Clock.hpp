#pragma once
#include <chrono>
#include <mutex>

namespace lanlink::util {

// Wall-clock source shared by every timer-driven component.
class Clock {
public:
  using time_point = std::chrono::system_clock::time_point;
  virtual ~Clock() = default;
  [[nodiscard]] virtual time_point now() const = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] time_point now() const override { return std::chrono::system_clock::now(); }
};

// Only moves when told to.
class ManualClock final : public Clock {
public:
  ManualClock() : now_(std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50)) {}
  explicit ManualClock(time_point start) : now_(start) {}

  [[nodiscard]] time_point now() const override {
    std::lock_guard<std::mutex> lk(mu_);
    return now_;
  }
  void advance(std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ += d;
  }
  void set(time_point t) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ = t;
  }

private:
  mutable std::mutex mu_;
  time_point now_;
};

} // namespace lanlink::util
