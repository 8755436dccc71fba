#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "app/EventChannel.hpp"
#include "model/Wifi.hpp"
#include "platform/Platform.hpp"

namespace lanlink::app {

class ConnectivityMonitor {
public:
  using AddressResolver = std::function<std::optional<std::string>()>;

  ConnectivityMonitor(EventChannel& events, platform::IConnectivitySource& source,
                      platform::IWifiPlatform& wifi, AddressResolver resolve_address);
  ~ConnectivityMonitor();
  ConnectivityMonitor(const ConnectivityMonitor&) = delete;
  ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

  // Subscribes to the source and takes an initial reading (no event for it).
  bool start();
  void stop();
  [[nodiscard]] bool running() const;

  // Never blocks on the platform.
  [[nodiscard]] model::ConnectivityState snapshot() const;

  // Source callback: refresh every field, then emit ConnectivityChanged.
  void handle_change(model::ConnectivityKind kind);

  // Called by the connector after a successful join or leave.
  void apply_wifi_link(const std::string& ssid, const std::string& bssid, int signal_dbm);
  void clear_wifi_link();

private:
  model::ConnectivityState resolve(model::ConnectivityKind kind);

  EventChannel& events_;
  platform::IConnectivitySource& source_;
  platform::IWifiPlatform& wifi_;
  AddressResolver resolve_address_;

  std::mutex change_mu_;     // changes are applied one at a time, in delivery order
  mutable std::mutex mu_;
  model::ConnectivityState state_{};
  bool running_{false};
};

} // namespace lanlink::app
