#include "model/Event.hpp"

#include <cstdio>
#include <type_traits>

namespace lanlink::model {

namespace {

template <typename T> constexpr const char* name_of();
template <> constexpr const char* name_of<events::Initialized>() { return "initialized"; }
template <> constexpr const char* name_of<events::ConfigUpdated>() { return "config_updated"; }
template <> constexpr const char* name_of<events::ConnectivityChanged>() { return "connectivity_changed"; }
template <> constexpr const char* name_of<events::NetworksScanned>() { return "networks_scanned"; }
template <> constexpr const char* name_of<events::Connecting>() { return "connecting"; }
template <> constexpr const char* name_of<events::Connected>() { return "connected"; }
template <> constexpr const char* name_of<events::Disconnecting>() { return "disconnecting"; }
template <> constexpr const char* name_of<events::Disconnected>() { return "disconnected"; }
template <> constexpr const char* name_of<events::PermissionDenied>() { return "permission_denied"; }
template <> constexpr const char* name_of<events::DiscoveryStarted>() { return "discovery_started"; }
template <> constexpr const char* name_of<events::DiscoveryStopped>() { return "discovery_stopped"; }
template <> constexpr const char* name_of<events::DevicesDiscovered>() { return "devices_discovered"; }
template <> constexpr const char* name_of<events::SharingServerStarted>() { return "sharing_server_started"; }
template <> constexpr const char* name_of<events::SharingServerStopped>() { return "sharing_server_stopped"; }
template <> constexpr const char* name_of<events::FileShared>() { return "file_shared"; }
template <> constexpr const char* name_of<events::QrCodeGenerated>() { return "qr_code_generated"; }
template <> constexpr const char* name_of<events::HotspotEnabled>() { return "hotspot_enabled"; }
template <> constexpr const char* name_of<events::HotspotDisabled>() { return "hotspot_disabled"; }
template <> constexpr const char* name_of<events::NetworksSaved>() { return "networks_saved"; }
template <> constexpr const char* name_of<events::Error>() { return "error"; }
template <> constexpr const char* name_of<events::TransferStarted>() { return "transfer_started"; }
template <> constexpr const char* name_of<events::TransferProgress>() { return "transfer_progress"; }
template <> constexpr const char* name_of<events::TransferFinished>() { return "transfer_finished"; }
template <> constexpr const char* name_of<events::PerformanceUpdated>() { return "performance_updated"; }

std::string fmt(const char* f, auto... args) {
  char buf[256];
  int n = std::snprintf(buf, sizeof(buf), f, args...);
  if (n < 0) return {};
  return std::string(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1);
}

} // namespace

const char* event_name(const NetworkEvent& ev) {
  return std::visit([](const auto& e) { return name_of<std::decay_t<decltype(e)>>(); }, ev);
}

std::string describe(const NetworkEvent& ev) {
  std::string out = event_name(ev);
  std::string detail = std::visit([](const auto& e) -> std::string {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, events::ConnectivityChanged>) return to_string(e.kind);
    else if constexpr (std::is_same_v<T, events::NetworksScanned> ||
                       std::is_same_v<T, events::DevicesDiscovered> ||
                       std::is_same_v<T, events::NetworksSaved>) return std::to_string(e.count);
    else if constexpr (std::is_same_v<T, events::Connecting> ||
                       std::is_same_v<T, events::Connected> ||
                       std::is_same_v<T, events::Disconnecting>) return e.ssid;
    else if constexpr (std::is_same_v<T, events::PermissionDenied>) return to_string(e.permission);
    else if constexpr (std::is_same_v<T, events::SharingServerStarted>) return "port " + std::to_string(e.port);
    else if constexpr (std::is_same_v<T, events::FileShared>) return e.path + " as " + e.share_id;
    else if constexpr (std::is_same_v<T, events::QrCodeGenerated>) return e.share_id;
    else if constexpr (std::is_same_v<T, events::Error>) return std::string(to_string(e.kind)) + ": " + e.message;
    else if constexpr (std::is_same_v<T, events::TransferStarted>)
      return e.transfer_id + " " + to_string(e.direction) + " " + e.file_name;
    else if constexpr (std::is_same_v<T, events::TransferProgress>)
      return e.transfer_id + fmt(" %llu/%llu bytes %.0f B/s",
                                 static_cast<unsigned long long>(e.transferred_bytes),
                                 static_cast<unsigned long long>(e.total_bytes), e.bytes_per_second);
    else if constexpr (std::is_same_v<T, events::TransferFinished>) return e.transfer_id + " " + to_string(e.state);
    else if constexpr (std::is_same_v<T, events::PerformanceUpdated>)
      return fmt("devices=%zu shares=%zu transfers=%zu cpu=%.1f%% mem=%.1f%%",
                 e.snapshot.discovered_devices, e.snapshot.shared_files, e.snapshot.active_transfers,
                 e.snapshot.system.cpu_usage_pct, e.snapshot.system.mem_usage_pct);
    else return {};
  }, ev);
  if (!detail.empty()) { out += ' '; out += detail; }
  return out;
}

} // namespace lanlink::model
