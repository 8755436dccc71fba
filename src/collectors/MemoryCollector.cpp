#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace lanlink::collectors {

namespace {

// Value of a "Key:   1234 kB" line in /proc/meminfo.
std::optional<uint64_t> meminfo_field(std::string_view text, std::string_view key) {
  size_t pos = 0;
  while (pos < text.size()) {
    size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) eol = text.size();
    std::string_view line = text.substr(pos, eol - pos);
    pos = eol + 1;
    if (!line.starts_with(key) || line.size() <= key.size() || line[key.size()] != ':') continue;
    std::string_view rest = line.substr(key.size() + 1);
    size_t digits = rest.find_first_not_of(" \t");
    if (digits == std::string_view::npos) return std::nullopt;
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(rest.data() + digits, rest.data() + rest.size(), v);
    if (ec != std::errc()) return std::nullopt;
    return v;
  }
  return std::nullopt;
}

} // namespace

// Needs MemAvailable (Linux 3.14+); older kernels report no memory load.
bool MemoryCollector::sample(model::MemorySample& out) const {
  auto text = util::read_file_string("/proc/meminfo");
  if (!text) return false;
  auto total = meminfo_field(*text, "MemTotal");
  auto avail = meminfo_field(*text, "MemAvailable");
  if (!total || !avail || *total == 0) return false;
  out.total_kb = *total;
  out.used_kb = *total > *avail ? *total - *avail : 0;
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(out.total_kb);
  return true;
}

} // namespace lanlink::collectors
