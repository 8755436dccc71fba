#include "app/WifiConnector.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace lanlink::app {

WifiConnector::WifiConnector(EventChannel& events, platform::IWifiPlatform& wifi,
                             platform::ISavedNetworkStore& store, ConnectivityMonitor& monitor,
                             const util::Clock& clock)
    : events_(events), wifi_(wifi), store_(store), monitor_(monitor), clock_(clock) {}

void WifiConnector::set_max_saved(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  max_saved_ = std::max(1, n);
  trim_locked();
}

void WifiConnector::trim_locked() {
  while (saved_.size() > static_cast<size_t>(max_saved_)) {
    auto oldest = std::min_element(saved_.begin(), saved_.end(), [](const auto& a, const auto& b) {
      return a.last_connected < b.last_connected;
    });
    saved_.erase(oldest);
  }
}

bool WifiConnector::load_saved() {
  std::optional<std::vector<model::SavedNetwork>> loaded;
  try {
    loaded = store_.load();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanlink: connector: loading saved networks failed: %s\n", e.what());
  }
  if (!loaded) {
    events_.publish(model::events::Error{model::ErrorKind::ConfigError, "saved networks could not be read"});
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  saved_.clear();
  for (auto& n : *loaded) {
    auto dup = std::find_if(saved_.begin(), saved_.end(), [&](const auto& s) { return s.bssid == n.bssid; });
    if (dup == saved_.end()) saved_.push_back(std::move(n));
  }
  trim_locked();
  return true;
}

bool WifiConnector::persist(const std::vector<model::SavedNetwork>& snapshot) {
  bool ok = false;
  try {
    ok = store_.save(snapshot);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanlink: connector: saving networks failed: %s\n", e.what());
  }
  if (!ok) {
    events_.publish(model::events::Error{model::ErrorKind::ConfigError, "saved networks could not be written"});
    return false;
  }
  events_.publish(model::events::NetworksSaved{snapshot.size()});
  return true;
}

bool WifiConnector::connect(const model::WifiNetwork& network, const std::optional<std::string>& password) {
  if (network.ssid.empty()) {
    events_.publish(model::events::Error{model::ErrorKind::ConnectionFailed, "network has no SSID"});
    return false;
  }
  if (network.is_secure && (!password || password->empty())) {
    events_.publish(model::events::Error{model::ErrorKind::ConnectionFailed,
                                         "password required for secure network " + network.ssid});
    return false;
  }

  std::lock_guard<std::mutex> op(op_mu_);
  events_.publish(model::events::Connecting{network.ssid});
  std::string why;
  bool joined = false;
  try {
    joined = wifi_.join(network.ssid, network.bssid, password.value_or(std::string()), &why);
  } catch (const std::exception& e) {
    why = e.what();
  }
  if (!joined) {
    std::string msg = "connection to " + network.ssid + " failed";
    if (!why.empty()) msg += ": " + why;
    std::fprintf(stderr, "lanlink: connector: %s\n", msg.c_str());
    events_.publish(model::events::Error{model::ErrorKind::ConnectionFailed, msg});
    return false;
  }

  monitor_.apply_wifi_link(network.ssid, network.bssid, network.signal_strength);

  std::vector<model::SavedNetwork> snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = clock_.now();
    auto it = std::find_if(saved_.begin(), saved_.end(), [&](const auto& s) { return s.bssid == network.bssid; });
    if (it != saved_.end()) {
      it->ssid = network.ssid;
      it->password = password.value_or(std::string());
      it->is_secure = network.is_secure;
      it->last_connected = now;
      it->connection_count += 1;
    } else {
      model::SavedNetwork s;
      s.ssid = network.ssid;
      s.bssid = network.bssid;
      s.password = password.value_or(std::string());
      s.is_secure = network.is_secure;
      s.last_connected = now;
      s.connection_count = 1;
      saved_.push_back(std::move(s));
      trim_locked();
    }
    snapshot = saved_;
  }
  (void)persist(snapshot);
  events_.publish(model::events::Connected{network.ssid});
  return true;
}

bool WifiConnector::disconnect() {
  std::lock_guard<std::mutex> op(op_mu_);
  auto st = monitor_.snapshot();
  if (!st.is_connected) return true;

  events_.publish(model::events::Disconnecting{st.ssid});
  std::string why;
  bool left = false;
  try {
    left = wifi_.leave(&why);
  } catch (const std::exception& e) {
    why = e.what();
  }
  if (!left) {
    std::string msg = "disconnect from " + st.ssid + " failed";
    if (!why.empty()) msg += ": " + why;
    events_.publish(model::events::Error{model::ErrorKind::ConnectionFailed, msg});
    return false;
  }
  monitor_.clear_wifi_link();
  events_.publish(model::events::Disconnected{});
  return true;
}

bool WifiConnector::forget(const std::string& bssid) {
  std::vector<model::SavedNetwork> snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(saved_.begin(), saved_.end(), [&](const auto& s) { return s.bssid == bssid; });
    if (it == saved_.end()) return false;
    saved_.erase(it);
    snapshot = saved_;
  }
  return persist(snapshot);
}

std::vector<model::SavedNetwork> WifiConnector::saved() const {
  std::lock_guard<std::mutex> lk(mu_);
  return saved_;
}

} // namespace lanlink::app
