#include "platform/Nmcli.hpp"
#include "util/AsciiLower.hpp"

#include <charconv>
#include <cstdio>
#include <exception>

namespace lanlink::platform {

namespace {

CommandRunner or_default(CommandRunner run) {
  if (run) return run;
  return [](const std::vector<std::string>& argv) { return util::run_process(argv); };
}

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return s.substr(i);
}

// Runs `nmcli args...`. On failure `error` gets nmcli's own message.
bool run_nmcli(const CommandRunner& run, const std::vector<std::string>& args, std::string* output,
               std::string* error) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.emplace_back("nmcli");
  argv.insert(argv.end(), args.begin(), args.end());
  std::optional<util::ProcessResult> r;
  try {
    r = run(argv);
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    return false;
  }
  if (!r) {
    if (error) *error = "nmcli could not be run or timed out";
    return false;
  }
  if (r->exit_code != 0) {
    if (error) {
      *error = trim(r->output);
      if (error->empty()) *error = "nmcli exited with status " + std::to_string(r->exit_code);
    }
    return false;
  }
  if (output) *output = std::move(r->output);
  return true;
}

template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (!line.empty()) fn(line);
    start = end + 1;
  }
}

int leading_int(std::string_view s) {
  int v = 0;
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

} // namespace

std::vector<std::string> split_terse(std::string_view line) {
  std::vector<std::string> fields(1);
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '\\' && i + 1 < line.size()) {
      fields.back() += line[++i];
    } else if (c == ':') {
      fields.emplace_back();
    } else {
      fields.back() += c;
    }
  }
  return fields;
}

std::vector<WifiScanRecord> parse_wifi_list(std::string_view text) {
  std::vector<WifiScanRecord> out;
  for_each_line(text, [&](std::string_view line) {
    auto f = split_terse(line);
    if (f.size() < 5) return;
    WifiScanRecord r;
    r.ssid = f[0];
    r.bssid = util::ascii_lower(f[1]);
    r.level_dbm = signal_percent_to_dbm(leading_int(f[2]));
    r.frequency_mhz = leading_int(f[3]);
    r.capabilities = f[4];
    out.push_back(std::move(r));
  });
  return out;
}

std::optional<WifiLink> parse_active_link(std::string_view text) {
  std::optional<WifiLink> link;
  for_each_line(text, [&](std::string_view line) {
    if (link) return;
    auto f = split_terse(line);
    if (f.size() < 4 || f[0] != "yes") return;
    link = WifiLink{f[1], util::ascii_lower(f[2]), signal_percent_to_dbm(leading_int(f[3]))};
  });
  return link;
}

std::optional<std::string> parse_wifi_device(std::string_view text, std::string_view state) {
  std::optional<std::string> dev;
  for_each_line(text, [&](std::string_view line) {
    if (dev) return;
    auto f = split_terse(line);
    if (f.size() < 3 || f[1] != "wifi") return;
    if (!f[2].starts_with(state)) return;
    dev = f[0];
  });
  return dev;
}

std::vector<std::vector<std::string>> hotspot_up_commands(const model::HotspotConfig& cfg) {
  std::vector<std::string> add{"connection", "add", "type", "wifi", "ifname", "*",
                               "con-name", kHotspotConnection, "autoconnect", "no",
                               "ssid", cfg.ssid,
                               "802-11-wireless.mode", "ap", "ipv4.method", "shared"};
  switch (cfg.security) {
    case model::HotspotSecurity::Open:
      break;
    case model::HotspotSecurity::Wep:
      add.insert(add.end(), {"wifi-sec.key-mgmt", "none", "wifi-sec.wep-key-type", "1",
                             "wifi-sec.wep-key0", cfg.password});
      break;
    case model::HotspotSecurity::Wpa:
      add.insert(add.end(), {"wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.proto", "wpa", "wifi-sec.psk", cfg.password});
      break;
    case model::HotspotSecurity::Wpa2:
      add.insert(add.end(), {"wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.proto", "rsn", "wifi-sec.psk", cfg.password});
      break;
    case model::HotspotSecurity::Wpa3:
      add.insert(add.end(), {"wifi-sec.key-mgmt", "sae", "wifi-sec.psk", cfg.password});
      break;
  }
  return {std::move(add), {"connection", "up", kHotspotConnection}};
}

NmcliWifiPlatform::NmcliWifiPlatform(CommandRunner run) : run_(or_default(std::move(run))) {}

bool NmcliWifiPlatform::run_ok(const std::vector<std::string>& args, std::string* output, std::string* error) {
  return run_nmcli(run_, args, output, error);
}

bool NmcliWifiPlatform::start_scan() {
  std::string why;
  bool ok = run_ok({"device", "wifi", "rescan"}, nullptr, &why);
  // NetworkManager rate-limits rescans; the cached list is still fresh then.
  if (!ok && why.find("not allowed") != std::string::npos) ok = true;
  if (!ok) std::fprintf(stderr, "lanlink: nmcli: rescan failed: %s\n", why.c_str());
  std::lock_guard<std::mutex> lk(mu_);
  scan_requested_ = ok;
  return ok;
}

std::optional<std::vector<WifiScanRecord>> NmcliWifiPlatform::scan_results() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!scan_requested_) return std::nullopt;
  }
  std::string out, why;
  if (!run_ok({"-t", "-f", "SSID,BSSID,SIGNAL,FREQ,SECURITY", "device", "wifi", "list", "--rescan", "no"}, &out, &why)) {
    std::fprintf(stderr, "lanlink: nmcli: wifi list failed: %s\n", why.c_str());
    return std::nullopt;
  }
  return parse_wifi_list(out);
}

bool NmcliWifiPlatform::join(const std::string& ssid, const std::string& bssid, const std::string& password,
                             std::string* error) {
  std::vector<std::string> args{"device", "wifi", "connect", ssid};
  if (!password.empty()) {
    args.emplace_back("password");
    args.push_back(password);
  }
  if (!bssid.empty()) {
    args.emplace_back("bssid");
    args.push_back(bssid);
  }
  return run_ok(args, nullptr, error);
}

bool NmcliWifiPlatform::leave(std::string* error) {
  std::string out;
  if (!run_ok({"-t", "-f", "DEVICE,TYPE,STATE", "device"}, &out, error)) return false;
  auto dev = parse_wifi_device(out, "connected");
  if (!dev) {
    if (error) *error = "no connected wifi device";
    return false;
  }
  return run_ok({"device", "disconnect", *dev}, nullptr, error);
}

std::optional<WifiLink> NmcliWifiPlatform::current_link() {
  std::string out;
  if (!run_ok({"-t", "-f", "ACTIVE,SSID,BSSID,SIGNAL", "device", "wifi", "list", "--rescan", "no"}, &out, nullptr))
    return std::nullopt;
  return parse_active_link(out);
}

NmcliHotspotPlatform::NmcliHotspotPlatform(CommandRunner run) : run_(or_default(std::move(run))) {}

bool NmcliHotspotPlatform::start_access_point(const model::HotspotConfig& cfg, std::string* error) {
  // A stale profile from an earlier run would make "add" create a duplicate.
  (void)run_nmcli(run_, {"connection", "delete", kHotspotConnection}, nullptr, nullptr);
  for (const auto& args : hotspot_up_commands(cfg)) {
    if (!run_nmcli(run_, args, nullptr, error)) {
      (void)run_nmcli(run_, {"connection", "delete", kHotspotConnection}, nullptr, nullptr);
      return false;
    }
  }
  // NetworkManager has no client cap for AP mode; max_clients is advisory.
  return true;
}

bool NmcliHotspotPlatform::stop_access_point(std::string* error) {
  if (!run_nmcli(run_, {"connection", "down", kHotspotConnection}, nullptr, error)) return false;
  (void)run_nmcli(run_, {"connection", "delete", kHotspotConnection}, nullptr, nullptr);
  return true;
}

} // namespace lanlink::platform
