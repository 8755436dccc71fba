#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "app/ConnectivityMonitor.hpp"
#include "app/EventChannel.hpp"
#include "model/Wifi.hpp"
#include "platform/Platform.hpp"
#include "util/Clock.hpp"

namespace lanlink::app {

// Joins networks and owns the saved-network registry (one entry per BSSID,
// bounded, least recently connected evicted first).
class WifiConnector {
public:
  WifiConnector(EventChannel& events, platform::IWifiPlatform& wifi, platform::ISavedNetworkStore& store,
                ConnectivityMonitor& monitor, const util::Clock& clock);

  void set_max_saved(int n);
  // Replaces the registry with the persisted one (trimmed to the bound).
  bool load_saved();

  bool connect(const model::WifiNetwork& network, const std::optional<std::string>& password);
  bool disconnect();
  bool forget(const std::string& bssid);

  [[nodiscard]] std::vector<model::SavedNetwork> saved() const;

private:
  // Persists `snapshot` and emits NetworksSaved.
  bool persist(const std::vector<model::SavedNetwork>& snapshot);
  void trim_locked();

  EventChannel& events_;
  platform::IWifiPlatform& wifi_;
  platform::ISavedNetworkStore& store_;
  ConnectivityMonitor& monitor_;
  const util::Clock& clock_;

  std::mutex op_mu_;          // one join/leave at a time
  mutable std::mutex mu_;     // guards saved_ and max_saved_
  std::vector<model::SavedNetwork> saved_;
  int max_saved_{20};
};

} // namespace lanlink::app
