#include "app/WifiScanner.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <thread>

namespace lanlink::app {

namespace {

struct InFlightGuard {
  std::atomic<bool>& flag;
  ~InFlightGuard() { flag.store(false); }
};

} // namespace

WifiScanner::WifiScanner(EventChannel& events, platform::IWifiPlatform& wifi,
                         platform::IPermissionBroker& permissions, ScanOptions opts)
    : events_(events), wifi_(wifi), permissions_(permissions), opts_(opts) {}

model::WifiNetwork WifiScanner::classify(const platform::WifiScanRecord& rec) {
  model::WifiNetwork n;
  n.ssid = rec.ssid;
  n.bssid = rec.bssid;
  n.signal_strength = rec.level_dbm;
  n.frequency = rec.frequency_mhz;
  n.capabilities = rec.capabilities;
  n.is_secure = model::capabilities_are_secure(rec.capabilities);
  return n;
}

std::vector<model::WifiNetwork> WifiScanner::available() const {
  std::lock_guard<std::mutex> lk(mu_);
  return networks_;
}

void WifiScanner::fail(const std::string& message) {
  std::fprintf(stderr, "lanlink: scanner: %s\n", message.c_str());
  events_.publish(model::events::Error{model::ErrorKind::ScanFailed, message});
}

bool WifiScanner::scan(std::chrono::milliseconds timeout) {
  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true)) return false;
  InFlightGuard guard{in_flight_};

  if (!permissions_.granted(model::Permission::Location)) {
    events_.publish(model::events::PermissionDenied{model::Permission::Location});
    return false;
  }
  try {
    return run_scan(timeout);
  } catch (const std::exception& e) {
    fail(std::string("scan failed: ") + e.what());
    return false;
  }
}

bool WifiScanner::run_scan(std::chrono::milliseconds timeout) {
  using clock = std::chrono::steady_clock;
  auto deadline = clock::now() + timeout;
  if (!wifi_.start_scan()) {
    fail(std::string(wifi_.name()) + " refused to start a scan");
    return false;
  }
  std::this_thread::sleep_for(std::min(opts_.settle, timeout));

  std::optional<std::vector<platform::WifiScanRecord>> records;
  for (;;) {
    records = wifi_.scan_results();
    if (records) break;
    if (clock::now() >= deadline) {
      fail("scan timed out after " + std::to_string(timeout.count()) + " ms");
      return false;
    }
    std::this_thread::sleep_for(opts_.poll);
  }

  std::vector<model::WifiNetwork> found;
  found.reserve(records->size());
  for (const auto& r : *records) found.push_back(classify(r));
  std::stable_sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
    return a.signal_strength > b.signal_strength;
  });
  size_t count = found.size();
  {
    std::lock_guard<std::mutex> lk(mu_);
    networks_ = std::move(found);
  }
  events_.publish(model::events::NetworksScanned{count});
  return true;
}

} // namespace lanlink::app
