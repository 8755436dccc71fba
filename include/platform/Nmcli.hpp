#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "platform/Platform.hpp"
#include "util/Subprocess.hpp"

// NetworkManager backends driven through the nmcli CLI in terse mode.
namespace lanlink::platform {

using CommandRunner = std::function<std::optional<util::ProcessResult>(const std::vector<std::string>& argv)>;

inline constexpr const char* kHotspotConnection = "lanlink-hotspot";

// One `nmcli -t` line split on unescaped ':'. "\:" and "\\" are unescaped.
[[nodiscard]] std::vector<std::string> split_terse(std::string_view line);

// nmcli reports signal quality 0..100; approximated as dBm.
[[nodiscard]] constexpr int signal_percent_to_dbm(int pct) {
  if (pct < 0) pct = 0;
  if (pct > 100) pct = 100;
  return pct / 2 - 100;
}

// Output of `-f SSID,BSSID,SIGNAL,FREQ,SECURITY device wifi list`.
[[nodiscard]] std::vector<WifiScanRecord> parse_wifi_list(std::string_view text);
// Output of `-f ACTIVE,SSID,BSSID,SIGNAL device wifi list`.
[[nodiscard]] std::optional<WifiLink> parse_active_link(std::string_view text);
// Output of `-f DEVICE,TYPE,STATE device`: the first wifi device in `state`.
[[nodiscard]] std::optional<std::string> parse_wifi_device(std::string_view text, std::string_view state);

// argv lists for creating and activating the access-point profile.
[[nodiscard]] std::vector<std::vector<std::string>> hotspot_up_commands(const model::HotspotConfig& cfg);

class NmcliWifiPlatform final : public IWifiPlatform {
public:
  // Empty runner means util::run_process.
  explicit NmcliWifiPlatform(CommandRunner run = {});

  bool start_scan() override;
  std::optional<std::vector<WifiScanRecord>> scan_results() override;
  bool join(const std::string& ssid, const std::string& bssid, const std::string& password,
            std::string* error) override;
  bool leave(std::string* error) override;
  std::optional<WifiLink> current_link() override;
  const char* name() const override { return "nmcli"; }

private:
  bool run_ok(const std::vector<std::string>& args, std::string* output, std::string* error);

  CommandRunner run_;
  std::mutex mu_;
  bool scan_requested_{false};
};

class NmcliHotspotPlatform final : public IHotspotPlatform {
public:
  explicit NmcliHotspotPlatform(CommandRunner run = {});

  bool start_access_point(const model::HotspotConfig& cfg, std::string* error) override;
  bool stop_access_point(std::string* error) override;
  const char* name() const override { return "nmcli"; }

private:
  CommandRunner run_;
};

} // namespace lanlink::platform
