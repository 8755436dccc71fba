#include "model/Config.hpp"
#include "util/AsciiLower.hpp"

namespace lanlink::model {

const char* to_string(HotspotSecurity s) {
  switch (s) {
    case HotspotSecurity::Open: return "open";
    case HotspotSecurity::Wep:  return "wep";
    case HotspotSecurity::Wpa:  return "wpa";
    case HotspotSecurity::Wpa2: return "wpa2";
    case HotspotSecurity::Wpa3: return "wpa3";
  }
  return "wpa2";
}

std::optional<HotspotSecurity> parse_hotspot_security(std::string_view s) {
  std::string v = util::ascii_lower(s);
  if (v == "open" || v == "none") return HotspotSecurity::Open;
  if (v == "wep") return HotspotSecurity::Wep;
  if (v == "wpa") return HotspotSecurity::Wpa;
  if (v == "wpa2") return HotspotSecurity::Wpa2;
  if (v == "wpa3") return HotspotSecurity::Wpa3;
  return std::nullopt;
}

std::string validate(const NetworkConfig& cfg) {
  if (cfg.default_port == 0) return "default port must be in 1..65535";
  if (cfg.max_concurrent_transfers < 1) return "max concurrent transfers must be at least 1";
  if (cfg.max_file_size == 0) return "max file size must be positive";
  if (cfg.max_saved_networks < 1) return "max saved networks must be at least 1";
  if (cfg.scan_timeout.count() <= 0) return "scan timeout must be positive";
  if (cfg.session_timeout.count() < 0) return "session timeout must not be negative";
  return {};
}

std::string validate(const HotspotConfig& cfg) {
  if (cfg.ssid.empty() || cfg.ssid.size() > 32) return "hotspot ssid must be 1..32 bytes";
  if (cfg.max_clients < 1) return "hotspot must allow at least one client";
  if (cfg.timeout.count() < 0) return "hotspot timeout must not be negative";
  switch (cfg.security) {
    case HotspotSecurity::Open:
      break;
    case HotspotSecurity::Wep:
      if (cfg.password.size() != 5 && cfg.password.size() != 13)
        return "WEP hotspot password must be 5 or 13 characters";
      break;
    case HotspotSecurity::Wpa:
    case HotspotSecurity::Wpa2:
    case HotspotSecurity::Wpa3:
      if (cfg.password.size() < 8 || cfg.password.size() > 63)
        return "WPA hotspot password must be 8..63 characters";
      break;
  }
  return {};
}

} // namespace lanlink::model
