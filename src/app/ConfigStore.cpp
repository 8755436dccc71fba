#include "app/ConfigStore.hpp"
#include "util/TomlReader.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <system_error>

namespace lanlink::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("LANLINK_", 0) == 0) {
    alt = std::string("lanlink_") + n.substr(8);
  } else if (n.rfind("lanlink_", 0) == 0) {
    alt = std::string("LANLINK_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static uint64_t getenv_u64(const char* name, uint64_t defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v || *v == '-') return defv;
  try { return std::stoull(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static uint64_t resolve_u64(const util::TomlReader& toml, bool have_toml,
                            const char* section, const char* key,
                            const char* env_name, uint64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_u64(section, key, def);
  if (env_name)
    return getenv_u64(env_name, def);
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

ConfigStore::ConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path ConfigStore::default_config_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / "lanlink" / "config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / ".config" / "lanlink" / "config.toml";
  return {};
}

bool ConfigStore::load() {
  util::TomlReader toml;
  bool have_toml = !path_.empty() && toml.load(path_.string());

  const model::NetworkConfig d{};
  model::NetworkConfig n{};
  int port = resolve_int(toml, have_toml, "network", "port", "LANLINK_PORT", d.default_port);
  n.default_port = (port >= 1 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
  n.enable_auto_discovery      = resolve_bool(toml, have_toml, "network", "auto_discovery",      "LANLINK_AUTO_DISCOVERY", d.enable_auto_discovery);
  n.enable_qr_code             = resolve_bool(toml, have_toml, "network", "qr_code",             "LANLINK_QR_CODE", d.enable_qr_code);
  n.enable_password_protection = resolve_bool(toml, have_toml, "network", "password_protection", "LANLINK_PASSWORD_PROTECTION", d.enable_password_protection);
  n.session_timeout   = std::chrono::seconds(resolve_int(toml, have_toml, "network", "session_timeout_s", "LANLINK_SESSION_TIMEOUT",
                                                         static_cast<int>(d.session_timeout.count())));
  n.max_concurrent_transfers = resolve_int(toml, have_toml, "network", "max_concurrent_transfers", "LANLINK_MAX_TRANSFERS", d.max_concurrent_transfers);
  n.max_file_size     = resolve_u64(toml, have_toml, "network", "max_file_size", "LANLINK_MAX_FILE_SIZE", d.max_file_size);
  n.scan_timeout      = std::chrono::milliseconds(resolve_int(toml, have_toml, "network", "scan_timeout_ms", "LANLINK_SCAN_TIMEOUT",
                                                              static_cast<int>(d.scan_timeout.count())));
  n.max_saved_networks = resolve_int(toml, have_toml, "network", "max_saved_networks", "LANLINK_MAX_SAVED_NETWORKS", d.max_saved_networks);

  const model::HotspotConfig hd{};
  model::HotspotConfig h{};
  h.ssid = resolve_string(toml, have_toml, "hotspot", "ssid", "LANLINK_HOTSPOT_SSID", hd.ssid);
  // Never read from the file: the password is not persisted in clear text
  h.password = resolve_string(toml, false, "hotspot", "password", "LANLINK_HOTSPOT_PASSWORD", hd.password);
  auto sec = resolve_string(toml, have_toml, "hotspot", "security", "LANLINK_HOTSPOT_SECURITY", model::to_string(hd.security));
  h.security = model::parse_hotspot_security(sec).value_or(hd.security);
  h.max_clients = resolve_int(toml, have_toml, "hotspot", "max_clients", "LANLINK_HOTSPOT_MAX_CLIENTS", hd.max_clients);
  h.timeout = std::chrono::seconds(resolve_int(toml, have_toml, "hotspot", "timeout_s", "LANLINK_HOTSPOT_TIMEOUT",
                                               static_cast<int>(hd.timeout.count())));

  bool ok = have_toml;
  if (auto why = model::validate(n); !why.empty()) {
    std::fprintf(stderr, "lanlink: config: %s; using network defaults\n", why.c_str());
    n = d;
    ok = false;
  }
  if (auto why = model::validate(h); !why.empty()) {
    std::fprintf(stderr, "lanlink: config: %s; using hotspot defaults\n", why.c_str());
    h = hd;
    ok = false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  network_ = n;
  hotspot_ = h;
  return ok;
}

bool ConfigStore::save() const {
  if (path_.empty()) return true;
  model::NetworkConfig n;
  model::HotspotConfig h;
  {
    std::lock_guard<std::mutex> lk(mu_);
    n = network_;
    h = hotspot_;
  }
  util::TomlReader toml;
  toml.set("network", "port", static_cast<int>(n.default_port));
  toml.set("network", "auto_discovery", n.enable_auto_discovery);
  toml.set("network", "qr_code", n.enable_qr_code);
  toml.set("network", "password_protection", n.enable_password_protection);
  toml.set("network", "session_timeout_s", static_cast<int>(n.session_timeout.count()));
  toml.set("network", "max_concurrent_transfers", n.max_concurrent_transfers);
  toml.set_u64("network", "max_file_size", n.max_file_size);
  toml.set("network", "scan_timeout_ms", static_cast<int>(n.scan_timeout.count()));
  toml.set("network", "max_saved_networks", n.max_saved_networks);
  toml.set("hotspot", "ssid", h.ssid);
  toml.set("hotspot", "security", std::string(model::to_string(h.security)));
  toml.set("hotspot", "max_clients", h.max_clients);
  toml.set("hotspot", "timeout_s", static_cast<int>(h.timeout.count()));

  std::error_code ec;
  if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    std::fprintf(stderr, "lanlink: config: cannot create %s: %s\n",
                 path_.parent_path().c_str(), ec.message().c_str());
    return false;
  }
  auto tmp = path_;
  tmp += ".tmp";
  if (!toml.save(tmp.string())) {
    std::fprintf(stderr, "lanlink: config: cannot write %s\n", tmp.c_str());
    return false;
  }
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    std::fprintf(stderr, "lanlink: config: cannot replace %s: %s\n", path_.c_str(), ec.message().c_str());
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

model::NetworkConfig ConfigStore::network() const {
  std::lock_guard<std::mutex> lk(mu_);
  return network_;
}

model::HotspotConfig ConfigStore::hotspot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return hotspot_;
}

void ConfigStore::set_network(const model::NetworkConfig& cfg) {
  std::lock_guard<std::mutex> lk(mu_);
  network_ = cfg;
}

void ConfigStore::set_hotspot(const model::HotspotConfig& cfg) {
  std::lock_guard<std::mutex> lk(mu_);
  hotspot_ = cfg;
}

} // namespace lanlink::app
