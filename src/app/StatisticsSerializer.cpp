#include "app/StatisticsSerializer.hpp"
#include "util/Json.hpp"

#include <chrono>

namespace lanlink::app {

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void emit_config(util::JsonWriter& w, const model::NetworkConfig& c) {
  w.key("config").begin_object();
  w.key("defaultPort").value(static_cast<int>(c.default_port));
  w.key("enableAutoDiscovery").value(c.enable_auto_discovery);
  w.key("enableQrCode").value(c.enable_qr_code);
  w.key("enablePasswordProtection").value(c.enable_password_protection);
  w.key("sessionTimeoutSeconds").value(static_cast<int64_t>(c.session_timeout.count()));
  w.key("maxConcurrentTransfers").value(c.max_concurrent_transfers);
  w.key("maxFileSize").value(c.max_file_size);
  w.key("scanTimeoutMs").value(static_cast<int64_t>(c.scan_timeout.count()));
  w.key("maxSavedNetworks").value(c.max_saved_networks);
  w.end_object();
}

void emit_performance(util::JsonWriter& w, const model::PerformanceSnapshot& p) {
  w.key("performance").begin_object();
  w.key("takenAt").value(epoch_ms(p.taken_at));
  w.key("availableNetworks").value(static_cast<uint64_t>(p.available_networks));
  w.key("savedNetworks").value(static_cast<uint64_t>(p.saved_networks));
  w.key("discoveredDevices").value(static_cast<uint64_t>(p.discovered_devices));
  w.key("sharedFiles").value(static_cast<uint64_t>(p.shared_files));
  w.key("activeTransfers").value(static_cast<uint64_t>(p.active_transfers));
  w.key("transferRate").value(p.transfer_rate_bps);
  w.key("signalStrength").value(p.signal_strength);
  w.key("system");
  if (p.has_system_load) {
    w.begin_object();
    w.key("cpuUsage").value(p.system.cpu_usage_pct);
    w.key("memoryUsage").value(p.system.mem_usage_pct);
    w.key("memoryTotalKb").value(p.system.mem_total_kb);
    w.key("memoryUsedKb").value(p.system.mem_used_kb);
    w.end_object();
  } else {
    w.null();
  }
  w.end_object();
}

} // namespace

std::string statistics_to_json(const model::NetworkStatistics& st) {
  util::JsonWriter w;
  w.begin_object();
  w.key("initialized").value(st.initialized);
  emit_config(w, st.config);

  w.key("connectivity").begin_object();
  w.key("kind").value(model::to_string(st.connectivity.kind));
  w.key("isConnected").value(st.connectivity.is_connected);
  w.key("ssid").value(st.connectivity.ssid);
  w.key("bssid").value(st.connectivity.bssid);
  w.key("signalStrength").value(st.connectivity.signal_strength);
  w.key("localIp").value(st.connectivity.local_ip);
  w.end_object();

  w.key("wifi").begin_object();
  w.key("availableNetworks").value(static_cast<uint64_t>(st.available_networks));
  w.key("savedNetworks").value(static_cast<uint64_t>(st.saved_networks));
  w.key("scanning").value(st.scanning);
  w.end_object();

  w.key("discovery").begin_object();
  w.key("running").value(st.discovering);
  w.key("devices").value(static_cast<uint64_t>(st.discovered_devices));
  w.end_object();

  w.key("sharing").begin_object();
  w.key("running").value(st.server_running);
  w.key("port").value(static_cast<int>(st.server_port));
  w.key("sharedFiles").value(static_cast<uint64_t>(st.shared_files));
  w.key("sharedBytes").value(st.shared_bytes);
  w.key("totalDownloads").value(st.total_downloads);
  w.end_object();

  w.key("transfers").begin_object();
  w.key("active").value(static_cast<uint64_t>(st.active_transfers));
  w.key("maxConcurrent").value(st.max_concurrent_transfers);
  w.key("rate").value(st.transfer_rate_bps);
  w.end_object();

  w.key("hotspot").begin_object();
  w.key("enabled").value(st.hotspot_enabled);
  w.key("ssid").value(st.hotspot_ssid);
  w.key("security").value(model::to_string(st.hotspot_security));
  w.end_object();

  emit_performance(w, st.performance);
  w.end_object();
  return w.take();
}

} // namespace lanlink::app
