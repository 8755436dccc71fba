#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lanlink::model {

enum class HotspotSecurity { Open, Wep, Wpa, Wpa2, Wpa3 };

struct NetworkConfig {
  uint16_t default_port{8080};
  bool enable_auto_discovery{true};
  bool enable_qr_code{true};
  bool enable_password_protection{false};
  std::chrono::seconds session_timeout{std::chrono::hours(1)}; // 0 = links never expire
  int max_concurrent_transfers{5};
  uint64_t max_file_size{100ull * 1024 * 1024};
  std::chrono::milliseconds scan_timeout{std::chrono::seconds(10)};
  int max_saved_networks{20};

  bool operator==(const NetworkConfig&) const = default;
};

struct HotspotConfig {
  std::string ssid{"lanlink_hotspot"};
  std::string password{"lanlink123"};
  HotspotSecurity security{HotspotSecurity::Wpa2};
  int max_clients{10};
  std::chrono::seconds timeout{std::chrono::hours(2)}; // 0 = stays up until disabled

  bool operator==(const HotspotConfig&) const = default;
};

[[nodiscard]] const char* to_string(HotspotSecurity s);
[[nodiscard]] std::optional<HotspotSecurity> parse_hotspot_security(std::string_view s);

// Empty when the config is usable, otherwise a description of the first bad field.
[[nodiscard]] std::string validate(const NetworkConfig& cfg);
[[nodiscard]] std::string validate(const HotspotConfig& cfg);

} // namespace lanlink::model
