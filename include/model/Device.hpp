#pragma once
#include <chrono>
#include <map>
#include <string>

namespace lanlink::model {

enum class DeviceType { Mobile, Desktop, Tablet, Server, Unknown };

struct DiscoveredDevice {
  std::string id;
  std::string name;
  std::string ip_address;
  DeviceType type{DeviceType::Unknown};
  std::chrono::system_clock::time_point last_seen{};
  bool is_online{true};
  std::map<std::string, std::string> metadata;
};

[[nodiscard]] const char* to_string(DeviceType t);

} // namespace lanlink::model
