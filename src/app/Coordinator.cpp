#include "app/Coordinator.hpp"

#include <cstdio>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace lanlink::app {

namespace {

constexpr model::Permission kPermissions[] = {
    model::Permission::Location,
    model::Permission::NearbyWifiDevices,
    model::Permission::AccessWifiState,
    model::Permission::ChangeWifiState,
};

Dependencies validated(Dependencies d) {
  if (!d.clock) throw std::invalid_argument("lanlink: coordinator: clock is required");
  if (!d.wifi) throw std::invalid_argument("lanlink: coordinator: wifi platform is required");
  if (!d.hotspot) throw std::invalid_argument("lanlink: coordinator: hotspot platform is required");
  if (!d.metrics) throw std::invalid_argument("lanlink: coordinator: metrics provider is required");
  if (!d.permissions) throw std::invalid_argument("lanlink: coordinator: permission broker is required");
  if (!d.connectivity) throw std::invalid_argument("lanlink: coordinator: connectivity source is required");
  if (!d.discovery) throw std::invalid_argument("lanlink: coordinator: discovery protocol is required");
  if (!d.saved_networks) throw std::invalid_argument("lanlink: coordinator: saved-network store is required");
  if (!d.http) throw std::invalid_argument("lanlink: coordinator: http listener is required");
  if (!d.http_client) throw std::invalid_argument("lanlink: coordinator: http client is required");
  if (!d.config) throw std::invalid_argument("lanlink: coordinator: config store is required");
  return d;
}

} // namespace

Coordinator::Coordinator(Dependencies deps)
    : deps_(validated(std::move(deps))),
      scheduler_(*deps_.clock),
      config_(*deps_.config),
      monitor_(events_, *deps_.connectivity, *deps_.wifi, deps_.address_resolver),
      scanner_(events_, *deps_.wifi, *deps_.permissions, deps_.scan_options),
      connector_(events_, *deps_.wifi, *deps_.saved_networks, monitor_, *deps_.clock),
      discovery_(events_, *deps_.discovery, scheduler_, *deps_.clock),
      transfers_(events_, *deps_.clock, model::NetworkConfig{}.max_concurrent_transfers),
      sharing_(events_, *deps_.http, transfers_, *deps_.clock,
               [this] {
                 auto st = monitor_.snapshot();
                 if (!st.local_ip.empty()) return st.local_ip;
                 if (deps_.address_resolver)
                   if (auto ip = deps_.address_resolver()) return *ip;
                 return std::string();
               }),
      peers_(events_, transfers_, *deps_.http_client),
      hotspot_(events_, *deps_.hotspot, scheduler_) {}

Coordinator::~Coordinator() {
  shutdown();
  // Handlers may still call into the components; let them finish first.
  events_.flush();
}

void Coordinator::report(model::ErrorKind kind, const std::string& message) {
  std::fprintf(stderr, "lanlink: coordinator: %s\n", message.c_str());
  events_.publish(model::events::Error{kind, message});
}

bool Coordinator::require_initialized(const char* op) {
  if (initialized_.load()) return true;
  report(model::ErrorKind::NotInitialized, std::string(op) + ": not initialized");
  return false;
}

SharingOptions Coordinator::sharing_options(const model::NetworkConfig& cfg) const {
  SharingOptions o;
  o.default_port = cfg.default_port;
  o.enable_qr_code = cfg.enable_qr_code;
  o.enable_password_protection = cfg.enable_password_protection;
  o.session_timeout = cfg.session_timeout;
  o.max_file_size = cfg.max_file_size;
  o.upload_dir = deps_.upload_dir;
  return o;
}

bool Coordinator::apply_config(const model::NetworkConfig& cfg) {
  transfers_.set_max_concurrent(cfg.max_concurrent_transfers);
  connector_.set_max_saved(cfg.max_saved_networks);
  return sharing_.configure(sharing_options(cfg));
}

bool Coordinator::initialize(const std::optional<model::NetworkConfig>& cfg) {
  std::lock_guard<std::recursive_mutex> lk(lifecycle_mu_);
  if (initialized_.load()) return true;

  model::NetworkConfig resolved;
  if (cfg) {
    resolved = *cfg;
  } else {
    if (!config_.load())
      std::fprintf(stderr, "lanlink: coordinator: no usable config at %s, using defaults\n", config_.path().c_str());
    resolved = config_.network();
  }
  if (auto why = model::validate(resolved); !why.empty()) {
    report(model::ErrorKind::ConfigError, "invalid configuration: " + why);
    return false;
  }
  config_.set_network(resolved);

  size_t granted = 0;
  for (auto p : kPermissions) {
    bool ok = false;
    try {
      ok = deps_.permissions->request(p);
    } catch (const std::exception& e) {
      std::fprintf(stderr, "lanlink: coordinator: permission %s request failed: %s\n", model::to_string(p), e.what());
    }
    if (ok) {
      ++granted;
    } else {
      events_.publish(model::events::PermissionDenied{p});
    }
  }
  if (granted == 0) {
    report(model::ErrorKind::PermissionDenied, "initialization failed: every permission was denied");
    return false;
  }

  if (!apply_config(resolved)) {
    report(model::ErrorKind::SharingServerError, "initialization failed: sharing engine could not be configured");
    return false;
  }
  if (!monitor_.start())
    std::fprintf(stderr, "lanlink: coordinator: connectivity monitoring unavailable, continuing\n");
  hotspot_.set_config(config_.hotspot());

  metrics_task_ = scheduler_.schedule_every("metrics", kMetricsInterval, [this] { collect_performance(); });
  sweep_task_ = scheduler_.schedule_every("share-sweep", SharingServer::kSweepInterval,
                                          [this] { (void)sharing_.sweep_expired(); });
  if (deps_.run_scheduler_thread) scheduler_.start();

  (void)connector_.load_saved();
  initialized_.store(true);
  std::fprintf(stderr, "lanlink: coordinator: initialized (%zu/%zu permissions)\n", granted, std::size(kPermissions));
  events_.publish(model::events::Initialized{});
  return true;
}

model::NetworkConfig Coordinator::config() const { return config_.network(); }

bool Coordinator::update_config(const model::NetworkConfig& cfg) {
  if (!require_initialized("update_config")) return false;
  std::lock_guard<std::recursive_mutex> lk(lifecycle_mu_);
  if (auto why = model::validate(cfg); !why.empty()) {
    report(model::ErrorKind::ConfigError, "invalid configuration: " + why);
    return false;
  }
  // The sharing engine goes first: it is the only part that can refuse, and
  // it restores its previous port and options when it does.
  if (!sharing_.reconfigure(sharing_options(cfg))) {
    report(model::ErrorKind::ConfigError, "configuration not applied, keeping the previous settings");
    return false;
  }
  transfers_.set_max_concurrent(cfg.max_concurrent_transfers);
  connector_.set_max_saved(cfg.max_saved_networks);
  config_.set_network(cfg);
  if (!config_.save())
    report(model::ErrorKind::ConfigError, "configuration could not be saved to " + config_.path().string());
  events_.publish(model::events::ConfigUpdated{});
  return true;
}

std::optional<std::vector<model::WifiNetwork>> Coordinator::scan_networks() {
  if (!require_initialized("scan_networks")) return std::nullopt;
  if (!scanner_.scan(config_.network().scan_timeout)) return std::nullopt;
  return scanner_.available();
}

bool Coordinator::connect_to_network(const model::WifiNetwork& network, const std::optional<std::string>& password) {
  if (!require_initialized("connect_to_network")) return false;
  return connector_.connect(network, password);
}

bool Coordinator::disconnect() {
  if (!require_initialized("disconnect")) return false;
  return connector_.disconnect();
}

bool Coordinator::forget_network(const std::string& bssid) {
  if (!require_initialized("forget_network")) return false;
  return connector_.forget(bssid);
}

std::vector<model::WifiNetwork> Coordinator::available_networks() const { return scanner_.available(); }
std::vector<model::SavedNetwork> Coordinator::saved_networks() const { return connector_.saved(); }
model::ConnectivityState Coordinator::connectivity() const { return monitor_.snapshot(); }

bool Coordinator::start_discovery() {
  if (!require_initialized("start_discovery")) return false;
  return discovery_.start();
}

bool Coordinator::stop_discovery() {
  if (!require_initialized("stop_discovery")) return false;
  discovery_.stop();
  return true;
}

std::vector<model::DiscoveredDevice> Coordinator::discovered_devices() const { return discovery_.devices(); }

bool Coordinator::start_server(const ServerStartRequest& req) {
  if (!require_initialized("start_server")) return false;
  std::lock_guard<std::recursive_mutex> lk(lifecycle_mu_);
  if (!sharing_.start(req)) return false;
  if (config_.network().enable_auto_discovery && !discovery_.running()) (void)discovery_.start();
  return true;
}

bool Coordinator::stop_server() {
  if (!require_initialized("stop_server")) return false;
  std::lock_guard<std::recursive_mutex> lk(lifecycle_mu_);
  sharing_.stop();
  return true;
}

std::optional<std::string> Coordinator::share_file(const ShareRequest& req) {
  if (!require_initialized("share_file")) return std::nullopt;
  std::lock_guard<std::recursive_mutex> lk(lifecycle_mu_);
  return sharing_.share_file(req);
}

bool Coordinator::unshare_file(const std::string& id) {
  if (!require_initialized("unshare_file")) return false;
  return sharing_.unshare(id);
}

std::optional<std::string> Coordinator::generate_qr_code(const std::string& id) {
  if (!require_initialized("generate_qr_code")) return std::nullopt;
  return sharing_.generate_qr_code(id);
}

std::vector<model::SharedFileEntry> Coordinator::shared_files() const { return sharing_.shared_files(); }

AccessResult Coordinator::check_access(const std::string& id, const std::optional<std::string>& password) const {
  return sharing_.check_access(id, password);
}

bool Coordinator::download_file(const std::string& url, const std::filesystem::path& save_path,
                                const std::optional<std::string>& password) {
  if (!require_initialized("download_file")) return false;
  return peers_.download(url, save_path, password);
}

bool Coordinator::upload_file(const std::filesystem::path& path, const std::string& url,
                              const std::optional<std::string>& password) {
  if (!require_initialized("upload_file")) return false;
  return peers_.upload(path, url, password);
}

bool Coordinator::cancel_transfer(const std::string& id) {
  if (!require_initialized("cancel_transfer")) return false;
  return transfers_.cancel(id);
}

std::vector<model::TransferSession> Coordinator::transfers() const { return transfers_.sessions(); }

bool Coordinator::enable_hotspot(const std::optional<std::string>& ssid, const std::optional<std::string>& password,
                                 model::HotspotSecurity security) {
  if (!require_initialized("enable_hotspot")) return false;
  return hotspot_.enable(ssid, password, security);
}

bool Coordinator::disable_hotspot() {
  if (!require_initialized("disable_hotspot")) return false;
  return hotspot_.disable();
}

bool Coordinator::hotspot_enabled() const { return hotspot_.enabled(); }

void Coordinator::collect_performance() {
  model::PerformanceSnapshot s;
  s.taken_at = deps_.clock->now();
  s.available_networks = scanner_.available().size();
  s.saved_networks = connector_.saved().size();
  s.discovered_devices = discovery_.devices().size();
  s.shared_files = sharing_.shared_files().size();
  s.active_transfers = transfers_.active_count();
  s.transfer_rate_bps = transfers_.aggregate_rate();
  s.signal_strength = monitor_.snapshot().signal_strength;
  try {
    model::SystemLoad load;
    s.has_system_load = deps_.metrics->sample(load);
    if (s.has_system_load) s.system = load;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanlink: coordinator: metrics sample failed: %s\n", e.what());
  }
  {
    std::lock_guard<std::mutex> lk(perf_mu_);
    last_perf_ = s;
  }
  events_.publish(model::events::PerformanceUpdated{s});
}

std::optional<model::PerformanceSnapshot> Coordinator::last_performance() const {
  std::lock_guard<std::mutex> lk(perf_mu_);
  return last_perf_;
}

model::NetworkStatistics Coordinator::get_network_statistics() const {
  model::NetworkStatistics st;
  st.initialized = initialized_.load();
  st.config = config_.network();
  st.connectivity = monitor_.snapshot();
  st.available_networks = scanner_.available().size();
  st.saved_networks = connector_.saved().size();
  st.scanning = scanner_.scanning();
  st.discovering = discovery_.running();
  st.discovered_devices = discovery_.devices().size();
  st.server_running = sharing_.running();
  st.server_port = sharing_.port();
  for (const auto& e : sharing_.shared_files()) {
    ++st.shared_files;
    st.shared_bytes += e.size;
    st.total_downloads += e.download_count;
  }
  st.active_transfers = transfers_.active_count();
  st.max_concurrent_transfers = transfers_.max_concurrent();
  st.transfer_rate_bps = transfers_.aggregate_rate();
  auto hs = hotspot_.config();
  st.hotspot_enabled = hotspot_.enabled();
  st.hotspot_ssid = hs.ssid;
  st.hotspot_security = hs.security;
  if (auto p = last_performance()) st.performance = *p;
  return st;
}

void Coordinator::shutdown() {
  std::lock_guard<std::recursive_mutex> lk(lifecycle_mu_);
  if (!initialized_.exchange(false)) return;
  scheduler_.cancel(metrics_task_);
  scheduler_.cancel(sweep_task_);
  metrics_task_ = sweep_task_ = 0;
  transfers_.cancel_all();
  sharing_.stop();
  discovery_.stop();
  (void)hotspot_.disable();
  monitor_.stop();
  scheduler_.stop();
  std::fprintf(stderr, "lanlink: coordinator: shut down\n");
}

} // namespace lanlink::app
