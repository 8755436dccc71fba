#include "app/ConnectivityMonitor.hpp"

#include <cstdio>
#include <exception>

namespace lanlink::app {

ConnectivityMonitor::ConnectivityMonitor(EventChannel& events, platform::IConnectivitySource& source,
                                         platform::IWifiPlatform& wifi, AddressResolver resolve_address)
    : events_(events), source_(source), wifi_(wifi), resolve_address_(std::move(resolve_address)) {}

ConnectivityMonitor::~ConnectivityMonitor() { stop(); }

bool ConnectivityMonitor::start() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return true;
  }
  model::ConnectivityKind kind = model::ConnectivityKind::None;
  try {
    kind = source_.current();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanlink: connectivity: initial check failed: %s\n", e.what());
  }
  {
    std::lock_guard<std::mutex> change(change_mu_);
    auto st = resolve(kind);
    std::lock_guard<std::mutex> lk(mu_);
    state_ = std::move(st);
  }
  if (!source_.start([this](model::ConnectivityKind k) { handle_change(k); })) {
    std::fprintf(stderr, "lanlink: connectivity: change notifications unavailable\n");
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  running_ = true;
  return true;
}

void ConnectivityMonitor::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return;
    running_ = false;
  }
  source_.stop();
}

bool ConnectivityMonitor::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return running_;
}

model::ConnectivityState ConnectivityMonitor::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

model::ConnectivityState ConnectivityMonitor::resolve(model::ConnectivityKind kind) {
  model::ConnectivityState st;
  st.kind = kind;
  if (kind == model::ConnectivityKind::Wifi) {
    try {
      if (auto link = wifi_.current_link()) {
        st.ssid = link->ssid;
        st.bssid = link->bssid;
        st.signal_strength = link->signal_dbm;
        st.is_connected = !link->ssid.empty();
      }
    } catch (const std::exception& e) {
      std::fprintf(stderr, "lanlink: connectivity: reading wifi link failed: %s\n", e.what());
    }
  }
  if (kind != model::ConnectivityKind::None && resolve_address_) {
    try {
      if (auto ip = resolve_address_()) st.local_ip = *ip;
    } catch (const std::exception& e) {
      std::fprintf(stderr, "lanlink: connectivity: resolving local address failed: %s\n", e.what());
    }
  }
  return st;
}

void ConnectivityMonitor::handle_change(model::ConnectivityKind kind) {
  {
    std::lock_guard<std::mutex> change(change_mu_);
    auto st = resolve(kind);
    std::lock_guard<std::mutex> lk(mu_);
    state_ = std::move(st);
  }
  events_.publish(model::events::ConnectivityChanged{kind});
}

void ConnectivityMonitor::apply_wifi_link(const std::string& ssid, const std::string& bssid, int signal_dbm) {
  std::optional<std::string> ip;
  if (resolve_address_) {
    try {
      ip = resolve_address_();
    } catch (const std::exception& e) {
      std::fprintf(stderr, "lanlink: connectivity: resolving local address failed: %s\n", e.what());
    }
  }
  std::lock_guard<std::mutex> lk(mu_);
  state_.kind = model::ConnectivityKind::Wifi;
  state_.ssid = ssid;
  state_.bssid = bssid;
  state_.signal_strength = signal_dbm;
  state_.is_connected = true;
  if (ip) state_.local_ip = *ip;
}

void ConnectivityMonitor::clear_wifi_link() {
  std::lock_guard<std::mutex> lk(mu_);
  state_.ssid.clear();
  state_.bssid.clear();
  state_.signal_strength = 0;
  state_.is_connected = false;
  if (state_.kind == model::ConnectivityKind::Wifi) {
    state_.kind = model::ConnectivityKind::None;
    state_.local_ip.clear();
  }
}

} // namespace lanlink::app
