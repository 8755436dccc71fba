#include "minitest.hpp"
#include "platform/Nmcli.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>

using namespace lanlink;

namespace {

// Replays canned nmcli results and records every argv.
struct ScriptedRunner {
  std::vector<std::vector<std::string>> calls;
  std::deque<std::optional<util::ProcessResult>> replies;

  platform::CommandRunner runner() {
    return [this](const std::vector<std::string>& argv) -> std::optional<util::ProcessResult> {
      calls.push_back(argv);
      if (replies.empty()) return util::ProcessResult{0, ""};
      auto r = replies.front();
      replies.pop_front();
      return r;
    };
  }
  void reply(int code, std::string out) { replies.push_back(util::ProcessResult{code, std::move(out)}); }
};

bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST(nmcli_split_terse_unescapes) {
  auto f = platform::split_terse("My\\:Net:AA\\:BB\\:CC:72:2437 MHz:WPA2");
  ASSERT_EQ(f.size(), 5u);
  ASSERT_EQ(f[0], "My:Net");
  ASSERT_EQ(f[1], "AA:BB:CC");
  ASSERT_EQ(f[4], "WPA2");
  auto g = platform::split_terse("back\\\\slash::");
  ASSERT_EQ(g.size(), 3u);
  ASSERT_EQ(g[0], "back\\slash");
  ASSERT_TRUE(g[1].empty());
  ASSERT_EQ(platform::split_terse("").size(), 1u);
}

TEST(nmcli_signal_percent_to_dbm) {
  ASSERT_EQ(platform::signal_percent_to_dbm(100), -50);
  ASSERT_EQ(platform::signal_percent_to_dbm(0), -100);
  ASSERT_EQ(platform::signal_percent_to_dbm(120), -50);
  ASSERT_EQ(platform::signal_percent_to_dbm(-5), -100);
  ASSERT_EQ(platform::signal_percent_to_dbm(60), -70);
}

TEST(nmcli_parse_wifi_list) {
  const char* text =
      "HomeWifi:AA\\:BB\\:CC\\:DD\\:EE\\:01:80:2437 MHz:WPA2\r\n"
      "short:line\n"
      "\n"
      ":AA\\:BB\\:CC\\:DD\\:EE\\:02:20:5180 MHz:\n";
  auto recs = platform::parse_wifi_list(text);
  ASSERT_EQ(recs.size(), 2u);
  ASSERT_EQ(recs[0].ssid, "HomeWifi");
  ASSERT_EQ(recs[0].bssid, "aa:bb:cc:dd:ee:01");
  ASSERT_EQ(recs[0].level_dbm, -60);
  ASSERT_EQ(recs[0].frequency_mhz, 2437);
  ASSERT_EQ(recs[0].capabilities, "WPA2");
  ASSERT_TRUE(recs[1].ssid.empty());
  ASSERT_EQ(recs[1].frequency_mhz, 5180);
}

TEST(nmcli_parse_active_link) {
  const char* text =
      "no:Other:AA\\:BB\\:CC\\:DD\\:EE\\:02:90\n"
      "yes:HomeWifi:AA\\:BB\\:CC\\:DD\\:EE\\:01:70\n";
  auto link = platform::parse_active_link(text);
  ASSERT_TRUE(link.has_value());
  ASSERT_EQ(link->ssid, "HomeWifi");
  ASSERT_EQ(link->bssid, "aa:bb:cc:dd:ee:01");
  ASSERT_EQ(link->signal_dbm, -65);
  ASSERT_FALSE(platform::parse_active_link("no:X:aa:10\n").has_value());
}

TEST(nmcli_parse_wifi_device) {
  const char* text =
      "enp3s0:ethernet:connected\n"
      "wlp2s0:wifi:connected (externally)\n"
      "p2p-dev-wlp2s0:wifi-p2p:disconnected\n";
  auto dev = platform::parse_wifi_device(text, "connected");
  ASSERT_TRUE(dev.has_value());
  ASSERT_EQ(*dev, "wlp2s0");
  ASSERT_FALSE(platform::parse_wifi_device(text, "disconnected").has_value());
}

TEST(nmcli_hotspot_commands_per_security) {
  model::HotspotConfig cfg;
  cfg.ssid = "field-ap";
  cfg.password = "password123";
  cfg.security = model::HotspotSecurity::Wpa2;
  auto cmds = platform::hotspot_up_commands(cfg);
  ASSERT_EQ(cmds.size(), 2u);
  ASSERT_TRUE(contains(cmds[0], "field-ap"));
  ASSERT_TRUE(contains(cmds[0], "rsn"));
  ASSERT_TRUE(contains(cmds[0], "password123"));
  ASSERT_EQ(cmds[1].back(), platform::kHotspotConnection);

  cfg.security = model::HotspotSecurity::Wpa3;
  ASSERT_TRUE(contains(platform::hotspot_up_commands(cfg)[0], "sae"));

  cfg.security = model::HotspotSecurity::Open;
  auto open = platform::hotspot_up_commands(cfg)[0];
  ASSERT_FALSE(contains(open, "wifi-sec.key-mgmt"));
  ASSERT_FALSE(contains(open, "password123"));
}

TEST(nmcli_join_builds_argv) {
  ScriptedRunner r;
  platform::NmcliWifiPlatform p(r.runner());
  std::string why;
  ASSERT_TRUE(p.join("Home Wifi", "aa:bb:cc:dd:ee:01", "secret", &why));
  ASSERT_EQ(r.calls.size(), 1u);
  std::vector<std::string> want{"nmcli", "device", "wifi", "connect", "Home Wifi",
                                "password", "secret", "bssid", "aa:bb:cc:dd:ee:01"};
  ASSERT_TRUE(r.calls[0] == want);

  ASSERT_TRUE(p.join("Open", "", "", &why));
  std::vector<std::string> want_open{"nmcli", "device", "wifi", "connect", "Open"};
  ASSERT_TRUE(r.calls[1] == want_open);
}

TEST(nmcli_join_failure_reports_output) {
  ScriptedRunner r;
  r.reply(4, "Error: Connection activation failed: Secrets were required.\n");
  platform::NmcliWifiPlatform p(r.runner());
  std::string why;
  ASSERT_FALSE(p.join("Home", "", "bad", &why));
  ASSERT_EQ(why, "Error: Connection activation failed: Secrets were required.");
}

TEST(nmcli_runner_exception_is_an_error) {
  platform::NmcliWifiPlatform p([](const std::vector<std::string>&) -> std::optional<util::ProcessResult> {
    throw std::runtime_error("spawn failed");
  });
  std::string why;
  ASSERT_FALSE(p.join("Home", "", "", &why));
  ASSERT_EQ(why, "spawn failed");
}

TEST(nmcli_leave_disconnects_connected_device) {
  ScriptedRunner r;
  r.reply(0, "wlp2s0:wifi:connected\n");
  r.reply(0, "");
  platform::NmcliWifiPlatform p(r.runner());
  std::string why;
  ASSERT_TRUE(p.leave(&why));
  ASSERT_EQ(r.calls.size(), 2u);
  std::vector<std::string> want{"nmcli", "device", "disconnect", "wlp2s0"};
  ASSERT_TRUE(r.calls[1] == want);
}

TEST(nmcli_leave_without_wifi_device) {
  ScriptedRunner r;
  r.reply(0, "enp3s0:ethernet:connected\n");
  platform::NmcliWifiPlatform p(r.runner());
  std::string why;
  ASSERT_FALSE(p.leave(&why));
  ASSERT_EQ(why, "no connected wifi device");
}

TEST(nmcli_scan_results_need_a_scan) {
  ScriptedRunner r;
  platform::NmcliWifiPlatform p(r.runner());
  ASSERT_FALSE(p.scan_results().has_value());
  r.reply(1, "Error: Scanning not allowed while already scanning.");
  ASSERT_TRUE(p.start_scan());
  r.reply(0, "HomeWifi:AA\\:BB\\:CC\\:DD\\:EE\\:01:80:2437 MHz:WPA2\n");
  auto recs = p.scan_results();
  ASSERT_TRUE(recs.has_value());
  ASSERT_EQ(recs->size(), 1u);
}

TEST(nmcli_hotspot_start_cleans_up_on_failure) {
  ScriptedRunner r;
  r.reply(10, "");                                  // stale profile delete
  r.reply(0, "");                                   // add
  r.reply(4, "Error: No suitable device found.");   // up
  platform::NmcliHotspotPlatform p(r.runner());
  model::HotspotConfig cfg;
  cfg.ssid = "ap";
  cfg.password = "password123";
  std::string why;
  ASSERT_FALSE(p.start_access_point(cfg, &why));
  ASSERT_EQ(why, "Error: No suitable device found.");
  ASSERT_EQ(r.calls.size(), 4u);
  ASSERT_TRUE(contains(r.calls.back(), "delete"));
}
