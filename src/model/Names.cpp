#include "model/Device.hpp"
#include "model/Event.hpp"
#include "model/Transfer.hpp"
#include "model/Wifi.hpp"

namespace lanlink::model {

const char* to_string(ConnectivityKind k) {
  switch (k) {
    case ConnectivityKind::None:     return "none";
    case ConnectivityKind::Wifi:     return "wifi";
    case ConnectivityKind::Ethernet: return "ethernet";
    case ConnectivityKind::Mobile:   return "mobile";
    case ConnectivityKind::Vpn:      return "vpn";
    case ConnectivityKind::Other:    return "other";
  }
  return "other";
}

const char* to_string(Permission p) {
  switch (p) {
    case Permission::Location:          return "location";
    case Permission::NearbyWifiDevices: return "nearby_wifi_devices";
    case Permission::AccessWifiState:   return "access_wifi_state";
    case Permission::ChangeWifiState:   return "change_wifi_state";
  }
  return "unknown";
}

const char* to_string(DeviceType t) {
  switch (t) {
    case DeviceType::Mobile:  return "mobile";
    case DeviceType::Desktop: return "desktop";
    case DeviceType::Tablet:  return "tablet";
    case DeviceType::Server:  return "server";
    case DeviceType::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(TransferDirection d) {
  return d == TransferDirection::Upload ? "upload" : "download";
}

const char* to_string(TransferState s) {
  switch (s) {
    case TransferState::Pending:   return "pending";
    case TransferState::Active:    return "active";
    case TransferState::Completed: return "completed";
    case TransferState::Failed:    return "failed";
    case TransferState::Cancelled: return "cancelled";
  }
  return "failed";
}

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::PermissionDenied:   return "permission_denied";
    case ErrorKind::ScanFailed:         return "scan_failed";
    case ErrorKind::ConnectionFailed:   return "connection_failed";
    case ErrorKind::DiscoveryFailed:    return "discovery_failed";
    case ErrorKind::SharingServerError: return "sharing_server_error";
    case ErrorKind::TransferFailed:     return "transfer_failed";
    case ErrorKind::HotspotError:       return "hotspot_error";
    case ErrorKind::ConfigError:        return "config_error";
    case ErrorKind::NotInitialized:     return "not_initialized";
  }
  return "error";
}

} // namespace lanlink::model
