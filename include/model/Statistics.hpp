#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include "model/Config.hpp"
#include "model/Wifi.hpp"

namespace lanlink::model {

// Host load as read from /proc.
struct SystemLoad {
  double cpu_usage_pct{};
  double mem_usage_pct{};
  uint64_t mem_total_kb{};
  uint64_t mem_used_kb{};
};

// Rebuilt on every metrics tick.
struct PerformanceSnapshot {
  std::chrono::system_clock::time_point taken_at{};
  size_t available_networks{};
  size_t saved_networks{};
  size_t discovered_devices{};
  size_t shared_files{};
  size_t active_transfers{};
  double transfer_rate_bps{};
  int signal_strength{};
  bool has_system_load{false};
  SystemLoad system{};
};

struct NetworkStatistics {
  bool initialized{};
  NetworkConfig config{};
  ConnectivityState connectivity{};
  size_t available_networks{};
  size_t saved_networks{};
  bool scanning{};
  bool discovering{};
  size_t discovered_devices{};
  bool server_running{};
  uint16_t server_port{};
  size_t shared_files{};
  uint64_t shared_bytes{};
  uint64_t total_downloads{};
  size_t active_transfers{};
  int max_concurrent_transfers{};
  double transfer_rate_bps{};
  bool hotspot_enabled{};
  std::string hotspot_ssid;
  HotspotSecurity hotspot_security{HotspotSecurity::Wpa2};
  PerformanceSnapshot performance{};
};

} // namespace lanlink::model
