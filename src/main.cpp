#include "app/Coordinator.hpp"
#include "app/StatisticsSerializer.hpp"
#include "model/Event.hpp"
#include "platform/Nmcli.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void usage() {
  std::cout <<
      "Usage: lanlink <command> [options]\n"
      "  serve [--port N] [--dir PATH] [--password P]\n"
      "  share FILE [--name N] [--password P] [--expiry SECONDS]\n"
      "  get URL [--out PATH] [--password P]\n"
      "  put FILE URL [--password P]\n"
      "  scan\n"
      "  connect SSID [--password P]\n"
      "  disconnect\n"
      "  discover [--seconds N]\n"
      "  hotspot on|off [--ssid S] [--password P] [--security open|wep|wpa|wpa2|wpa3]\n"
      "  stats\n"
      "Long-running commands print events until Ctrl+C.\n";
}

// Flags after the command; positional arguments are collected in order.
struct Args {
  std::vector<std::string> positional;
  std::optional<std::string> port, dir, password, name, expiry, seconds, ssid, security, out;
};

static bool parse_args(int argc, char** argv, Args& out) {
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&](std::optional<std::string>& dst) {
      if (i + 1 >= argc) return false;
      dst = argv[++i];
      return true;
    };
    bool ok = true;
    if (a == "--port") ok = next(out.port);
    else if (a == "--dir") ok = next(out.dir);
    else if (a == "--password") ok = next(out.password);
    else if (a == "--name") ok = next(out.name);
    else if (a == "--expiry") ok = next(out.expiry);
    else if (a == "--seconds") ok = next(out.seconds);
    else if (a == "--ssid") ok = next(out.ssid);
    else if (a == "--security") ok = next(out.security);
    else if (a == "--out") ok = next(out.out);
    else if (a.starts_with("--")) ok = false;
    else out.positional.push_back(a);
    if (!ok) {
      std::cerr << "lanlink: bad or incomplete option " << a << "\n";
      return false;
    }
  }
  return true;
}

static void wait_for_signal(std::optional<std::chrono::seconds> limit = std::nullopt) {
  auto end = std::chrono::steady_clock::now() + limit.value_or(std::chrono::hours(24 * 365));
  while (!g_stop.load() && std::chrono::steady_clock::now() < end) std::this_thread::sleep_for(200ms);
}

static int run(const std::string& cmd, const Args& args) {
  using namespace lanlink;

  // Switching the AP off does not need the rest of the stack.
  if (cmd == "hotspot" && !args.positional.empty() && args.positional[0] == "off") {
    platform::NmcliHotspotPlatform hotspot;
    std::string why;
    if (!hotspot.stop_access_point(&why)) {
      std::cerr << "lanlink: hotspot off failed: " << why << "\n";
      return 1;
    }
    std::cout << "hotspot disabled\n";
    return 0;
  }

  app::Coordinator coord(app::make_linux_dependencies());
  (void)coord.events().subscribe([](const model::NetworkEvent& ev) {
    std::cout << "[" << model::event_name(ev) << "] " << model::describe(ev) << std::endl;
  });
  if (!coord.initialize()) return 1;

  if (cmd == "serve") {
    app::ServerStartRequest req;
    if (args.port) req.port = static_cast<uint16_t>(std::stoi(*args.port));
    if (args.dir) req.directory = *args.dir;
    if (args.password) {
      req.enable_password = true;
      req.password = *args.password;
    }
    if (!coord.start_server(req)) return 1;
    for (const auto& e : coord.shared_files()) std::cout << e.name << "  " << e.url << "\n";
    wait_for_signal();
  } else if (cmd == "share") {
    if (args.positional.empty()) { usage(); return 2; }
    app::ShareRequest req;
    req.path = args.positional[0];
    req.custom_name = args.name;
    if (args.password) {
      req.enable_password = true;
      req.password = *args.password;
    }
    if (args.expiry) req.expiry = std::chrono::seconds(std::stoll(*args.expiry));
    auto id = coord.share_file(req);
    if (!id) return 1;
    for (const auto& e : coord.shared_files())
      if (e.id == *id) std::cout << e.url << "\n";
    wait_for_signal();
  } else if (cmd == "get") {
    if (args.positional.empty()) { usage(); return 2; }
    const std::string& url = args.positional[0];
    std::string save = args.out.value_or("");
    if (save.empty()) {
      auto slash = url.find_last_of('/');
      save = slash == std::string::npos || slash + 1 == url.size() ? "download.bin" : url.substr(slash + 1);
      save = save.substr(0, save.find('?'));
    }
    if (!coord.download_file(url, save, args.password)) return 1;
  } else if (cmd == "put") {
    if (args.positional.size() < 2) { usage(); return 2; }
    if (!coord.upload_file(args.positional[0], args.positional[1], args.password)) return 1;
  } else if (cmd == "scan") {
    auto nets = coord.scan_networks();
    if (!nets) return 1;
    for (const auto& n : *nets)
      std::cout << n.signal_strength << " dBm  " << (n.is_secure ? "secure" : "open  ") << "  "
                << n.bssid << "  " << n.ssid << "\n";
  } else if (cmd == "connect") {
    if (args.positional.empty()) { usage(); return 2; }
    const std::string& ssid = args.positional[0];
    model::WifiNetwork target;
    target.ssid = ssid;
    target.is_secure = args.password.has_value();
    if (auto nets = coord.scan_networks()) {
      for (const auto& n : *nets)
        if (n.ssid == ssid) { target = n; break; }  // strongest first
    }
    if (!coord.connect_to_network(target, args.password)) return 1;
  } else if (cmd == "disconnect") {
    if (!coord.disconnect()) return 1;
  } else if (cmd == "discover") {
    if (!coord.start_discovery()) return 1;
    int secs = args.seconds ? std::stoi(*args.seconds) : 10;
    wait_for_signal(std::chrono::seconds(secs));
    for (const auto& d : coord.discovered_devices())
      std::cout << d.ip_address << "  " << d.id << "  " << model::to_string(d.type) << "\n";
  } else if (cmd == "hotspot") {
    if (args.positional.empty() || args.positional[0] != "on") { usage(); return 2; }
    auto security = coord.get_network_statistics().hotspot_security;
    if (args.security) {
      auto parsed = model::parse_hotspot_security(*args.security);
      if (!parsed) {
        std::cerr << "lanlink: unknown security " << *args.security << "\n";
        return 2;
      }
      security = *parsed;
    }
    if (!coord.enable_hotspot(args.ssid, args.password, security)) return 1;
    wait_for_signal();
  } else if (cmd == "stats") {
    std::cout << app::statistics_to_json(coord.get_network_statistics()) << "\n";
  } else {
    usage();
    return 2;
  }
  coord.shutdown();
  return 0;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  if (argc < 2) {
    usage();
    return 2;
  }
  std::string cmd = argv[1];
  if (cmd == "-h" || cmd == "--help") {
    usage();
    return 0;
  }
  Args args;
  if (!parse_args(argc, argv, args)) return 2;
  try {
    return run(cmd, args);
  } catch (const std::exception& e) {
    std::cerr << "lanlink: " << e.what() << "\n";
    return 1;
  }
}
