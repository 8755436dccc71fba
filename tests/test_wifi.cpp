#include "minitest.hpp"
#include "fakes.hpp"
#include "app/ConnectivityMonitor.hpp"
#include "app/WifiConnector.hpp"
#include "app/WifiScanner.hpp"
#include <thread>

using namespace lanlink;
using namespace std::chrono_literals;

static app::ScanOptions fast_scan() {
  app::ScanOptions o;
  o.settle = 0ms;
  o.poll = 1ms;
  return o;
}

TEST(wifi_scan_sorts_by_signal_and_classifies) {
  app::EventChannel ch;
  testing::EventRecorder rec(ch);
  testing::FakeWifiPlatform wifi;
  testing::FakePermissions perms;
  (void)perms.request(model::Permission::Location);
  wifi.records = {
      testing::scan_record("weak", "00:00:00:00:00:01", -80, "[ESS]"),
      testing::scan_record("strong", "00:00:00:00:00:02", -40, "[WPA2-PSK-CCMP][ESS]"),
      testing::scan_record("mid", "00:00:00:00:00:03", -60, "[WEP]"),
  };
  app::WifiScanner scanner(ch, wifi, perms, fast_scan());
  ASSERT_TRUE(scanner.scan(1000ms));
  auto nets = scanner.available();
  ASSERT_EQ(nets.size(), 3u);
  ASSERT_EQ(nets[0].ssid, "strong");
  ASSERT_EQ(nets[1].ssid, "mid");
  ASSERT_EQ(nets[2].ssid, "weak");
  ASSERT_TRUE(nets[0].is_secure);
  ASSERT_TRUE(nets[1].is_secure);
  ASSERT_FALSE(nets[2].is_secure);
  ASSERT_EQ(rec.count("networks_scanned"), 1u);
}

TEST(wifi_scan_without_location_permission) {
  app::EventChannel ch;
  testing::EventRecorder rec(ch);
  testing::FakeWifiPlatform wifi;
  testing::FakePermissions perms;
  app::WifiScanner scanner(ch, wifi, perms, fast_scan());
  ASSERT_FALSE(scanner.scan(100ms));
  ASSERT_EQ(rec.count("permission_denied"), 1u);
  ASSERT_EQ(wifi.scans_started, 0);
}

TEST(wifi_scan_times_out_when_results_never_arrive) {
  app::EventChannel ch;
  testing::EventRecorder rec(ch);
  testing::FakeWifiPlatform wifi;
  wifi.results_ready = false;
  testing::FakePermissions perms;
  (void)perms.request(model::Permission::Location);
  app::WifiScanner scanner(ch, wifi, perms, fast_scan());
  ASSERT_FALSE(scanner.scan(20ms));
  ASSERT_EQ(rec.errors(model::ErrorKind::ScanFailed), 1u);
  ASSERT_FALSE(scanner.scanning());
}

TEST(wifi_scan_refused_by_radio) {
  app::EventChannel ch;
  testing::EventRecorder rec(ch);
  testing::FakeWifiPlatform wifi;
  wifi.accept_scan = false;
  testing::FakePermissions perms;
  (void)perms.request(model::Permission::Location);
  app::WifiScanner scanner(ch, wifi, perms, fast_scan());
  ASSERT_FALSE(scanner.scan(100ms));
  ASSERT_EQ(rec.errors(model::ErrorKind::ScanFailed), 1u);
}

TEST(wifi_second_scan_rejected_while_in_flight) {
  app::EventChannel ch;
  testing::FakeWifiPlatform wifi;
  wifi.results_ready = false;
  testing::FakePermissions perms;
  (void)perms.request(model::Permission::Location);
  app::WifiScanner scanner(ch, wifi, perms, fast_scan());
  std::jthread first([&] { (void)scanner.scan(300ms); });
  for (int i = 0; i < 100 && !scanner.scanning(); ++i) std::this_thread::sleep_for(1ms);
  ASSERT_TRUE(scanner.scanning());
  ASSERT_FALSE(scanner.scan(300ms));
  first.join();
  ASSERT_EQ(wifi.scans_started, 1);
}

TEST(wifi_capability_detection) {
  ASSERT_TRUE(model::capabilities_are_secure("[WPA2-PSK-CCMP][ESS]"));
  ASSERT_TRUE(model::capabilities_are_secure("WPA1 WPA2 802.1X"));
  ASSERT_TRUE(model::capabilities_are_secure("[RSN-SAE]"));
  ASSERT_FALSE(model::capabilities_are_secure("[ESS]"));
  ASSERT_FALSE(model::capabilities_are_secure(""));
}

struct ConnectorFixture {
  app::EventChannel ch;
  testing::EventRecorder rec{ch};
  util::ManualClock clock;
  testing::FakeWifiPlatform wifi;
  testing::FakeConnectivitySource src;
  testing::MemoryNetworkStore store;
  app::ConnectivityMonitor monitor{ch, src, wifi, [] { return std::optional<std::string>("192.168.0.9"); }};
  app::WifiConnector connector{ch, wifi, store, monitor, clock};
};

static model::WifiNetwork network(std::string ssid, std::string bssid, bool secure) {
  model::WifiNetwork n;
  n.ssid = std::move(ssid);
  n.bssid = std::move(bssid);
  n.signal_strength = -55;
  n.is_secure = secure;
  return n;
}

TEST(wifi_connect_secure_requires_password) {
  ConnectorFixture f;
  ASSERT_FALSE(f.connector.connect(network("lab", "aa:aa:aa:aa:aa:01", true), std::nullopt));
  ASSERT_FALSE(f.connector.connect(network("lab", "aa:aa:aa:aa:aa:01", true), std::string()));
  ASSERT_EQ(f.rec.errors(model::ErrorKind::ConnectionFailed), 2u);
  ASSERT_EQ(f.rec.count("connecting"), 0u);
  ASSERT_EQ(f.wifi.last_join_ssid, "");
}

TEST(wifi_connect_success_saves_and_updates_state) {
  ConnectorFixture f;
  ASSERT_TRUE(f.connector.connect(network("lab", "aa:aa:aa:aa:aa:01", true), std::string("pw123456")));
  ASSERT_EQ(f.wifi.last_join_password, "pw123456");
  auto names = f.rec.names();
  ASSERT_EQ(names.size(), 3u);
  ASSERT_EQ(names[0], "connecting");
  ASSERT_EQ(names[1], "networks_saved");
  ASSERT_EQ(names[2], "connected");
  auto st = f.monitor.snapshot();
  ASSERT_TRUE(st.is_connected);
  ASSERT_EQ(st.ssid, "lab");
  ASSERT_EQ(st.local_ip, "192.168.0.9");
  ASSERT_EQ(f.store.stored.size(), 1u);
  ASSERT_EQ(f.store.stored[0].password, "pw123456");

  // Same BSSID again bumps the count instead of adding an entry.
  f.clock.advance(1000ms);
  ASSERT_TRUE(f.connector.connect(network("lab", "aa:aa:aa:aa:aa:01", true), std::string("pw123456")));
  auto saved = f.connector.saved();
  ASSERT_EQ(saved.size(), 1u);
  ASSERT_EQ(saved[0].connection_count, 2);
}

TEST(wifi_connect_failure_reports_error) {
  ConnectorFixture f;
  f.wifi.join_ok = false;
  ASSERT_FALSE(f.connector.connect(network("open-net", "aa:aa:aa:aa:aa:02", false), std::nullopt));
  ASSERT_EQ(f.rec.count("connecting"), 1u);
  ASSERT_EQ(f.rec.errors(model::ErrorKind::ConnectionFailed), 1u);
  ASSERT_EQ(f.rec.count("connected"), 0u);
  ASSERT_TRUE(f.connector.saved().empty());
}

TEST(wifi_saved_networks_evict_least_recent) {
  ConnectorFixture f;
  f.connector.set_max_saved(2);
  ASSERT_TRUE(f.connector.connect(network("a", "aa:00:00:00:00:01", false), std::nullopt));
  f.clock.advance(1000ms);
  ASSERT_TRUE(f.connector.connect(network("b", "aa:00:00:00:00:02", false), std::nullopt));
  f.clock.advance(1000ms);
  ASSERT_TRUE(f.connector.connect(network("a", "aa:00:00:00:00:01", false), std::nullopt));
  f.clock.advance(1000ms);
  ASSERT_TRUE(f.connector.connect(network("c", "aa:00:00:00:00:03", false), std::nullopt));
  auto saved = f.connector.saved();
  ASSERT_EQ(saved.size(), 2u);
  for (const auto& s : saved) ASSERT_NE(s.ssid, "b");
}

TEST(wifi_disconnect_and_forget) {
  ConnectorFixture f;
  ASSERT_TRUE(f.connector.disconnect());  // nothing to leave
  ASSERT_EQ(f.rec.count("disconnecting"), 0u);
  ASSERT_TRUE(f.connector.connect(network("lab", "aa:aa:aa:aa:aa:01", false), std::nullopt));
  ASSERT_TRUE(f.connector.disconnect());
  ASSERT_EQ(f.rec.count("disconnecting"), 1u);
  ASSERT_EQ(f.rec.count("disconnected"), 1u);
  ASSERT_FALSE(f.monitor.snapshot().is_connected);

  ASSERT_TRUE(f.connector.forget("aa:aa:aa:aa:aa:01"));
  ASSERT_FALSE(f.connector.forget("aa:aa:aa:aa:aa:01"));
  ASSERT_TRUE(f.store.stored.empty());
}

TEST(wifi_load_saved_dedupes_and_reports_unreadable) {
  ConnectorFixture f;
  model::SavedNetwork s;
  s.ssid = "x";
  s.bssid = "aa:00:00:00:00:09";
  f.store.stored = {s, s};
  ASSERT_TRUE(f.connector.load_saved());
  ASSERT_EQ(f.connector.saved().size(), 1u);
  f.store.readable = false;
  ASSERT_FALSE(f.connector.load_saved());
  ASSERT_EQ(f.rec.errors(model::ErrorKind::ConfigError), 1u);
}
