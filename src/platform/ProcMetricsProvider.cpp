#include "platform/ProcMetricsProvider.hpp"

namespace lanlink::platform {

bool ProcMetricsProvider::sample(model::SystemLoad& out) {
  std::lock_guard<std::mutex> lk(mu_);
  model::CpuSample cpu;
  model::MemorySample mem;
  bool have_cpu = cpu_.sample(cpu);
  bool have_mem = mem_.sample(mem);
  if (!have_cpu && !have_mem) return false;
  if (have_cpu) out.cpu_usage_pct = cpu.usage_pct;
  if (have_mem) {
    out.mem_usage_pct = mem.used_pct;
    out.mem_total_kb = mem.total_kb;
    out.mem_used_kb = mem.used_kb;
  }
  return true;
}

} // namespace lanlink::platform
