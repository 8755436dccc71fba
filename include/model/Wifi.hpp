#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace lanlink::model {

enum class ConnectivityKind { None, Wifi, Ethernet, Mobile, Vpn, Other };

enum class Permission { Location, NearbyWifiDevices, AccessWifiState, ChangeWifiState };

// One access point from the most recent scan.
struct WifiNetwork {
  std::string ssid;
  std::string bssid;
  int signal_strength{};   // dBm
  int frequency{};         // MHz
  std::string capabilities;
  bool is_secure{};
};

struct SavedNetwork {
  std::string ssid;
  std::string bssid;
  std::string password;
  bool is_secure{};
  std::chrono::system_clock::time_point last_connected{};
  int connection_count{};
};

struct ConnectivityState {
  ConnectivityKind kind{ConnectivityKind::None};
  std::string ssid;
  std::string bssid;
  int signal_strength{};
  std::string local_ip;
  bool is_connected{};     // Wi-Fi client link is up
};

[[nodiscard]] const char* to_string(ConnectivityKind k);
[[nodiscard]] const char* to_string(Permission p);

// True when the capability string names any WEP/WPA/RSN/EAP style token.
[[nodiscard]] bool capabilities_are_secure(std::string_view caps);

} // namespace lanlink::model
