#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "model/Config.hpp"
#include "model/Device.hpp"
#include "model/Statistics.hpp"
#include "model/Wifi.hpp"

// Narrow OS capability seams. The coordination logic only talks to these,
// so tests can drive it with deterministic fakes.
namespace lanlink::platform {

// One access point as reported by the OS.
struct WifiScanRecord {
  std::string ssid;
  std::string bssid;
  int level_dbm{};
  int frequency_mhz{};
  std::string capabilities;
};

// Currently associated access point.
struct WifiLink {
  std::string ssid;
  std::string bssid;
  int signal_dbm{};
};

class IWifiPlatform {
public:
  virtual ~IWifiPlatform() = default;
  // Request a fresh scan. false if the radio refused.
  [[nodiscard]] virtual bool start_scan() = 0;
  // Results of the last scan; nullopt while none are available yet.
  [[nodiscard]] virtual std::optional<std::vector<WifiScanRecord>> scan_results() = 0;
  // Join; on failure `error` receives the reason.
  [[nodiscard]] virtual bool join(const std::string& ssid, const std::string& bssid,
                                  const std::string& password, std::string* error) = 0;
  [[nodiscard]] virtual bool leave(std::string* error) = 0;
  [[nodiscard]] virtual std::optional<WifiLink> current_link() = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

class IHotspotPlatform {
public:
  virtual ~IHotspotPlatform() = default;
  [[nodiscard]] virtual bool start_access_point(const model::HotspotConfig& cfg, std::string* error) = 0;
  [[nodiscard]] virtual bool stop_access_point(std::string* error) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

class IMetricsProvider {
public:
  virtual ~IMetricsProvider() = default;
  [[nodiscard]] virtual bool sample(model::SystemLoad& out) = 0;
};

class IPermissionBroker {
public:
  virtual ~IPermissionBroker() = default;
  // Ask for a permission; returns whether it is now held.
  [[nodiscard]] virtual bool request(model::Permission p) = 0;
  [[nodiscard]] virtual bool granted(model::Permission p) const = 0;
};

// OS connectivity-change notifications, delivered in order on one thread.
class IConnectivitySource {
public:
  using Listener = std::function<void(model::ConnectivityKind)>;
  virtual ~IConnectivitySource() = default;
  [[nodiscard]] virtual bool start(Listener listener) = 0;
  virtual void stop() = 0;
  [[nodiscard]] virtual model::ConnectivityKind current() = 0;
};

// LAN peer discovery. Every batch is the protocol's full current view.
class IDiscoveryProtocol {
public:
  using BatchHandler = std::function<void(std::vector<model::DiscoveredDevice>)>;
  virtual ~IDiscoveryProtocol() = default;
  [[nodiscard]] virtual bool start(BatchHandler on_batch) = 0;
  virtual void stop() = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

class ISavedNetworkStore {
public:
  virtual ~ISavedNetworkStore() = default;
  // Empty vector when nothing was stored yet; nullopt when the store is unreadable.
  [[nodiscard]] virtual std::optional<std::vector<model::SavedNetwork>> load() = 0;
  [[nodiscard]] virtual bool save(const std::vector<model::SavedNetwork>& networks) = 0;
};

} // namespace lanlink::platform
