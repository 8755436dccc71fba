#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>
#include "app/EventChannel.hpp"
#include "model/Wifi.hpp"
#include "platform/Platform.hpp"

namespace lanlink::app {

struct ScanOptions {
  std::chrono::milliseconds settle{std::chrono::seconds(3)};     // wait after triggering a scan
  std::chrono::milliseconds poll{std::chrono::milliseconds(250)}; // re-read cadence when results lag
};

class WifiScanner {
public:
  WifiScanner(EventChannel& events, platform::IWifiPlatform& wifi,
              platform::IPermissionBroker& permissions, ScanOptions opts = {});

  // One-shot scan. Returns false immediately if another scan is in flight.
  bool scan(std::chrono::milliseconds timeout);

  [[nodiscard]] std::vector<model::WifiNetwork> available() const;
  [[nodiscard]] bool scanning() const { return in_flight_.load(); }

  [[nodiscard]] static model::WifiNetwork classify(const platform::WifiScanRecord& rec);

private:
  bool run_scan(std::chrono::milliseconds timeout);
  void fail(const std::string& message);

  EventChannel& events_;
  platform::IWifiPlatform& wifi_;
  platform::IPermissionBroker& permissions_;
  ScanOptions opts_;
  std::atomic<bool> in_flight_{false};
  mutable std::mutex mu_;
  std::vector<model::WifiNetwork> networks_;
};

} // namespace lanlink::app
