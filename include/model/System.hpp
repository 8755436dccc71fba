#pragma once
#include <cstdint>

namespace lanlink::model {

// Jiffies from the aggregate "cpu" line of /proc/stat.
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSample {
  CpuTimes total_times{};
  double usage_pct{};     // 0..100 since the previous sample; 0 on the first
  int logical_threads{0};
};

struct MemorySample {
  uint64_t total_kb{};
  uint64_t used_kb{};
  double used_pct{};
};

} // namespace lanlink::model
