#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include "model/Config.hpp"

namespace lanlink::app {

// Holds the live NetworkConfig/HotspotConfig. Values resolve per key as
// TOML -> LANLINK_* environment -> compiled default.
class ConfigStore {
public:
  // An empty path keeps the store in memory only.
  explicit ConfigStore(std::filesystem::path path = default_config_path());

  // $XDG_CONFIG_HOME/lanlink/config.toml, else ~/.config/lanlink/config.toml.
  [[nodiscard]] static std::filesystem::path default_config_path();

  // Returns false if the file was absent (defaults and env still applied)
  // or if the resolved values fail validation (defaults kept).
  bool load();
  [[nodiscard]] bool save() const;

  [[nodiscard]] model::NetworkConfig network() const;
  [[nodiscard]] model::HotspotConfig hotspot() const;
  void set_network(const model::NetworkConfig& cfg);
  void set_hotspot(const model::HotspotConfig& cfg);

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  mutable std::mutex mu_;
  model::NetworkConfig network_{};
  model::HotspotConfig hotspot_{};
};

// Env helpers shared with the CLI. Accepts LANLINK_X or lanlink_x.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace lanlink::app
