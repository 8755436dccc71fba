#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace lanlink::collectors {

static void parse_cpu_line(std::string_view line, lanlink::model::CpuTimes& out) {
  // skip the "cpu" label
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{};
  int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

bool CpuCollector::sample(lanlink::model::CpuSample& out) {
  auto txt_opt = lanlink::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  lanlink::model::CpuTimes agg{};
  bool have_agg = false;
  int threads = 0;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); have_agg = true; }
    else if (have_agg && line.starts_with("cpu")) ++threads;
    else if (have_agg) break;
    start = end + 1;
  }
  if (!have_agg) return false;

  double usage = 0.0;
  if (has_last_) {
    auto td = agg.total() - last_total_.total();
    auto wd = agg.work() - last_total_.work();
    usage = (td > 0 && agg.total() >= last_total_.total())
                ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
  }
  last_total_ = agg;
  has_last_ = true;
  out.total_times = agg;
  out.usage_pct = usage;
  out.logical_threads = threads > 0 ? threads : 1;
  return true;
}

} // namespace lanlink::collectors
