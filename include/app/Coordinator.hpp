#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "app/ConfigStore.hpp"
#include "app/ConnectivityMonitor.hpp"
#include "app/DiscoveryService.hpp"
#include "app/EventChannel.hpp"
#include "app/HotspotController.hpp"
#include "app/HttpClient.hpp"
#include "app/HttpListener.hpp"
#include "app/PeerTransferClient.hpp"
#include "app/Scheduler.hpp"
#include "app/SharingServer.hpp"
#include "app/TransferSessionManager.hpp"
#include "app/WifiConnector.hpp"
#include "app/WifiScanner.hpp"
#include "model/Statistics.hpp"
#include "platform/Platform.hpp"
#include "util/Clock.hpp"

namespace lanlink::app {

// Everything the Coordinator needs from the outside world.
struct Dependencies {
  std::shared_ptr<util::Clock> clock;
  std::unique_ptr<platform::IWifiPlatform> wifi;
  std::unique_ptr<platform::IHotspotPlatform> hotspot;
  std::unique_ptr<platform::IMetricsProvider> metrics;
  std::unique_ptr<platform::IPermissionBroker> permissions;
  std::unique_ptr<platform::IConnectivitySource> connectivity;
  std::unique_ptr<platform::IDiscoveryProtocol> discovery;
  std::unique_ptr<platform::ISavedNetworkStore> saved_networks;
  std::unique_ptr<IHttpListener> http;
  std::unique_ptr<IHttpClient> http_client;
  std::unique_ptr<ConfigStore> config;
  ConnectivityMonitor::AddressResolver address_resolver;
  std::filesystem::path upload_dir;
  ScanOptions scan_options{};
  bool run_scheduler_thread{true};
};

// NetworkManager, rtnetlink, /proc/net/arp, io_uring HTTP, encrypted store.
[[nodiscard]] Dependencies make_linux_dependencies();

// Owns every component and the single scheduler. All commands other than
// initialize() fail fast with a NotInitialized error until it succeeds.
class Coordinator {
public:
  static constexpr std::chrono::seconds kMetricsInterval{5};

  // Throws std::invalid_argument when a dependency is missing.
  explicit Coordinator(Dependencies deps);
  ~Coordinator();
  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Idempotent. Without a config the store is loaded (TOML, env, defaults).
  bool initialize(const std::optional<model::NetworkConfig>& cfg = std::nullopt);
  [[nodiscard]] bool initialized() const { return initialized_.load(); }
  // All or nothing: a server that cannot move to a new port keeps the old
  // configuration, which is then neither persisted nor announced.
  bool update_config(const model::NetworkConfig& cfg);
  [[nodiscard]] model::NetworkConfig config() const;

  // Wi-Fi
  std::optional<std::vector<model::WifiNetwork>> scan_networks();
  bool connect_to_network(const model::WifiNetwork& network, const std::optional<std::string>& password);
  bool disconnect();
  bool forget_network(const std::string& bssid);
  [[nodiscard]] std::vector<model::WifiNetwork> available_networks() const;
  [[nodiscard]] std::vector<model::SavedNetwork> saved_networks() const;
  [[nodiscard]] model::ConnectivityState connectivity() const;

  // Discovery
  bool start_discovery();
  bool stop_discovery();
  [[nodiscard]] std::vector<model::DiscoveredDevice> discovered_devices() const;

  // Sharing
  bool start_server(const ServerStartRequest& req = {});
  bool stop_server();
  std::optional<std::string> share_file(const ShareRequest& req);
  bool unshare_file(const std::string& id);
  std::optional<std::string> generate_qr_code(const std::string& id);
  [[nodiscard]] std::vector<model::SharedFileEntry> shared_files() const;
  [[nodiscard]] AccessResult check_access(const std::string& id, const std::optional<std::string>& password) const;

  // Transfers. download_file and upload_file block until the transfer ends.
  bool download_file(const std::string& url, const std::filesystem::path& save_path,
                     const std::optional<std::string>& password = std::nullopt);
  bool upload_file(const std::filesystem::path& path, const std::string& url,
                   const std::optional<std::string>& password = std::nullopt);
  bool cancel_transfer(const std::string& id);
  [[nodiscard]] std::vector<model::TransferSession> transfers() const;

  // Hotspot
  bool enable_hotspot(const std::optional<std::string>& ssid, const std::optional<std::string>& password,
                      model::HotspotSecurity security);
  bool disable_hotspot();
  [[nodiscard]] bool hotspot_enabled() const;

  [[nodiscard]] model::NetworkStatistics get_network_statistics() const;
  [[nodiscard]] std::optional<model::PerformanceSnapshot> last_performance() const;

  // Stops everything; safe to call twice.
  void shutdown();

  EventChannel& events() { return events_; }
  Scheduler& scheduler() { return scheduler_; }

private:
  bool require_initialized(const char* op);
  void report(model::ErrorKind kind, const std::string& message);
  bool apply_config(const model::NetworkConfig& cfg);
  SharingOptions sharing_options(const model::NetworkConfig& cfg) const;
  void collect_performance();

  Dependencies deps_;
  EventChannel events_;
  Scheduler scheduler_;
  ConfigStore& config_;
  ConnectivityMonitor monitor_;
  WifiScanner scanner_;
  WifiConnector connector_;
  DiscoveryService discovery_;
  TransferSessionManager transfers_;
  SharingServer sharing_;
  PeerTransferClient peers_;
  HotspotController hotspot_;

  std::recursive_mutex lifecycle_mu_;   // initialize, update_config, server lifecycle, shutdown
  std::atomic<bool> initialized_{false};
  Scheduler::TaskId metrics_task_{0};
  Scheduler::TaskId sweep_task_{0};
  mutable std::mutex perf_mu_;
  std::optional<model::PerformanceSnapshot> last_perf_;
};

} // namespace lanlink::app
