#include "platform/EncryptedNetworkStore.hpp"
#include "util/TomlReader.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lanlink::platform {

namespace {

bool write_all(int fd, const unsigned char* p, size_t n) {
  while (n > 0) {
    ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    n -= static_cast<size_t>(w);
  }
  return true;
}

// Writes `data` to `path` atomically with mode 0600.
bool write_private(const fs::path& path, const unsigned char* data, size_t n) {
  fs::path tmp = path;
  tmp += ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) return false;
  bool ok = write_all(fd, data, n) && ::fsync(fd) == 0;
  ::close(fd);
  if (!ok) {
    ::unlink(tmp.c_str());
    return false;
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    ::unlink(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<util::Bytes> read_bytes(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  return util::Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string from_hex_string(const std::string& hex) {
  auto b = util::from_hex(hex);
  return b ? std::string(b->begin(), b->end()) : std::string();
}

} // namespace

EncryptedNetworkStore::EncryptedNetworkStore(fs::path dir) : dir_(dir.empty() ? default_dir() : std::move(dir)) {
  store_path_ = dir_ / "networks.enc";
  key_path_ = dir_ / "networks.key";
}

fs::path EncryptedNetworkStore::default_dir() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) return fs::path(xdg) / "lanlink";
  if (const char* home = std::getenv("HOME"); home && *home) return fs::path(home) / ".local/share/lanlink";
  return fs::path(".lanlink");
}

std::optional<util::Bytes> EncryptedNetworkStore::key(bool create) {
  if (auto k = read_bytes(key_path_)) {
    if (k->size() == util::kSealKeyBytes) return k;
    std::fprintf(stderr, "lanlink: network store: %s has the wrong size\n", key_path_.c_str());
    return std::nullopt;
  }
  if (!create) return std::nullopt;

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    std::fprintf(stderr, "lanlink: network store: cannot create %s: %s\n", dir_.c_str(), ec.message().c_str());
    return std::nullopt;
  }
  auto k = util::random_bytes(util::kSealKeyBytes);
  if (!k) return std::nullopt;
  int fd = ::open(key_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) {
    // Lost a race with another writer: use theirs.
    if (errno == EEXIST) return key(false);
    std::fprintf(stderr, "lanlink: network store: cannot create key: %s\n", std::strerror(errno));
    return std::nullopt;
  }
  bool ok = write_all(fd, k->data(), k->size()) && ::fsync(fd) == 0;
  ::close(fd);
  if (!ok) {
    ::unlink(key_path_.c_str());
    return std::nullopt;
  }
  return k;
}

std::optional<std::vector<model::SavedNetwork>> EncryptedNetworkStore::load() {
  std::error_code ec;
  if (!fs::exists(store_path_, ec)) return std::vector<model::SavedNetwork>{};

  auto blob = read_bytes(store_path_);
  const size_t magic_len = std::strlen(kMagic);
  if (!blob || blob->size() < magic_len || std::memcmp(blob->data(), kMagic, magic_len) != 0) {
    std::fprintf(stderr, "lanlink: network store: %s is not a network store\n", store_path_.c_str());
    return std::nullopt;
  }
  auto k = key(false);
  if (!k) {
    std::fprintf(stderr, "lanlink: network store: key missing for %s\n", store_path_.c_str());
    return std::nullopt;
  }
  auto text = util::unseal(*k, util::Bytes(blob->begin() + static_cast<std::ptrdiff_t>(magic_len), blob->end()));
  if (!text) {
    std::fprintf(stderr, "lanlink: network store: %s could not be decrypted\n", store_path_.c_str());
    return std::nullopt;
  }

  util::TomlReader toml;
  toml.load_string(*text);
  std::vector<model::SavedNetwork> out;
  for (const auto& sec : toml.sections()) {
    model::SavedNetwork n;
    n.ssid = from_hex_string(toml.get_string(sec, "ssid_hex"));
    n.bssid = toml.get_string(sec, "bssid");
    n.password = from_hex_string(toml.get_string(sec, "password_hex"));
    n.is_secure = toml.get_bool(sec, "secure");
    n.last_connected = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(toml.get_u64(sec, "last_connected_ms")));
    n.connection_count = toml.get_int(sec, "count");
    if (n.bssid.empty()) continue;
    out.push_back(std::move(n));
  }
  return out;
}

bool EncryptedNetworkStore::save(const std::vector<model::SavedNetwork>& networks) {
  auto k = key(true);
  if (!k) return false;

  util::TomlReader toml;
  for (size_t i = 0; i < networks.size(); ++i) {
    const auto& n = networks[i];
    std::string sec = "n" + std::to_string(i);
    toml.set(sec, "ssid_hex", util::to_hex(n.ssid));
    toml.set(sec, "bssid", n.bssid);
    toml.set(sec, "password_hex", util::to_hex(n.password));
    toml.set(sec, "secure", n.is_secure);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(n.last_connected.time_since_epoch()).count();
    toml.set_u64(sec, "last_connected_ms", ms > 0 ? static_cast<uint64_t>(ms) : 0);
    toml.set(sec, "count", n.connection_count);
  }

  auto sealed = util::seal(*k, toml.to_string());
  if (!sealed) {
    std::fprintf(stderr, "lanlink: network store: encryption failed\n");
    return false;
  }
  util::Bytes blob(kMagic, kMagic + std::strlen(kMagic));
  blob.insert(blob.end(), sealed->begin(), sealed->end());
  if (!write_private(store_path_, blob.data(), blob.size())) {
    std::fprintf(stderr, "lanlink: network store: cannot write %s: %s\n", store_path_.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}

} // namespace lanlink::platform
