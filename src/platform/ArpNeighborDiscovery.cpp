#include "platform/ArpNeighborDiscovery.hpp"
#include "util/AsciiLower.hpp"
#include "util/Procfs.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

namespace lanlink::platform {

namespace {

constexpr unsigned long kAtfComplete = 0x2;

std::vector<std::string_view> fields_of(std::string_view line) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    size_t j = i;
    while (j < line.size() && line[j] != ' ' && line[j] != '\t') ++j;
    if (j > i) out.push_back(line.substr(i, j - i));
    i = j;
  }
  return out;
}

} // namespace

ArpNeighborDiscovery::ArpNeighborDiscovery(const util::Clock& clock, std::chrono::milliseconds interval)
    : clock_(clock), interval_(interval) {}

ArpNeighborDiscovery::~ArpNeighborDiscovery() { stop(); }

std::vector<model::DiscoveredDevice> ArpNeighborDiscovery::parse_arp_table(std::string_view text,
                                                                          util::Clock::time_point now) {
  std::vector<model::DiscoveredDevice> out;
  size_t start = text.find('\n');  // header row
  if (start == std::string_view::npos) return out;
  ++start;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto f = fields_of(text.substr(start, end - start));
    start = end + 1;
    // IP, HW type, Flags, HW address, Mask, Device
    if (f.size() < 6) continue;
    unsigned long flags = std::strtoul(std::string(f[2]).c_str(), nullptr, 16);
    if (!(flags & kAtfComplete)) continue;
    std::string mac = util::ascii_lower(f[3]);
    if (mac == "00:00:00:00:00:00") continue;

    model::DiscoveredDevice d;
    d.id = mac;
    d.ip_address = std::string(f[0]);
    d.name = d.ip_address;
    d.type = model::DeviceType::Unknown;
    d.last_seen = now;
    d.is_online = true;
    d.metadata["mac"] = mac;
    d.metadata["iface"] = std::string(f[5]);
    out.push_back(std::move(d));
  }
  return out;
}

bool ArpNeighborDiscovery::start(BatchHandler on_batch) {
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return true;
  if (!util::read_file_string("/proc/net/arp")) {
    std::fprintf(stderr, "lanlink: arp: /proc/net/arp is not readable\n");
    return false;
  }
  on_batch_ = std::move(on_batch);
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
  return true;
}

void ArpNeighborDiscovery::stop() {
  std::jthread t;
  {
    std::lock_guard<std::mutex> lk(mu_);
    t = std::move(thread_);
  }
  if (t.joinable()) {
    t.request_stop();
    cv_.notify_all();
    t.join();
  }
}

void ArpNeighborDiscovery::run(std::stop_token st) {
  while (!st.stop_requested()) {
    if (auto txt = util::read_file_string("/proc/net/arp")) {
      try {
        on_batch_(parse_arp_table(*txt, clock_.now()));
      } catch (const std::exception& e) {
        std::fprintf(stderr, "lanlink: arp: batch handler failed: %s\n", e.what());
      }
    }
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, st, interval_, [] { return false; });
  }
}

} // namespace lanlink::platform
