#include "minitest.hpp"
#include "fakes.hpp"
#include "app/ConfigStore.hpp"
#include "model/Config.hpp"
#include <cstdlib>

using namespace lanlink;

static void clear_config_env() {
  for (const char* n : {"LANLINK_PORT", "LANLINK_MAX_TRANSFERS", "LANLINK_AUTO_DISCOVERY", "LANLINK_HOTSPOT_SSID",
                        "LANLINK_HOTSPOT_PASSWORD", "LANLINK_HOTSPOT_SECURITY", "lanlink_PORT"})
    unsetenv(n);
}

TEST(config_defaults_without_file) {
  clear_config_env();
  testing::TempDir dir("cfg_defaults");
  app::ConfigStore store(dir.path() / "absent.toml");
  ASSERT_FALSE(store.load());
  auto n = store.network();
  ASSERT_EQ(n.default_port, 8080);
  ASSERT_EQ(n.max_concurrent_transfers, 5);
  ASSERT_EQ(n.max_file_size, 100ull * 1024 * 1024);
  ASSERT_EQ(n.session_timeout.count(), 3600);
  ASSERT_TRUE(n.enable_auto_discovery);
  ASSERT_EQ(store.hotspot().ssid, "lanlink_hotspot");
}

TEST(config_toml_then_env_then_default) {
  clear_config_env();
  testing::TempDir dir("cfg_layers");
  auto path = dir.write("config.toml",
                        "[network]\n"
                        "port = 9000\n"
                        "[hotspot]\n"
                        "security = wpa3\n");
  setenv("LANLINK_PORT", "7000", 1);
  setenv("LANLINK_MAX_TRANSFERS", "2", 1);
  app::ConfigStore store(path);
  ASSERT_TRUE(store.load());
  ASSERT_EQ(store.network().default_port, 9000);        // file wins over env
  ASSERT_EQ(store.network().max_concurrent_transfers, 2);  // env fills the gap
  ASSERT_EQ(store.network().max_saved_networks, 20);    // default
  ASSERT_TRUE(store.hotspot().security == model::HotspotSecurity::Wpa3);
  clear_config_env();
}

TEST(config_lowercase_env_alias) {
  clear_config_env();
  setenv("lanlink_PORT", "8443", 1);
  app::ConfigStore store{std::filesystem::path{}};
  (void)store.load();
  ASSERT_EQ(store.network().default_port, 8443);
  clear_config_env();
}

TEST(config_invalid_values_fall_back) {
  clear_config_env();
  testing::TempDir dir("cfg_invalid");
  auto path = dir.write("config.toml", "[network]\nport = 70000\nmax_concurrent_transfers = 3\n");
  app::ConfigStore store(path);
  ASSERT_FALSE(store.load());
  ASSERT_EQ(store.network().default_port, 8080);
  ASSERT_EQ(store.network().max_concurrent_transfers, 5);
}

TEST(config_save_and_reload) {
  clear_config_env();
  testing::TempDir dir("cfg_save");
  auto path = dir.path() / "nested" / "config.toml";
  app::ConfigStore store(path);
  model::NetworkConfig n;
  n.default_port = 9100;
  n.enable_qr_code = false;
  n.max_file_size = 5ull * 1024 * 1024 * 1024;
  store.set_network(n);
  model::HotspotConfig h;
  h.ssid = "field-ap";
  h.password = "should-not-persist";
  store.set_hotspot(h);
  ASSERT_TRUE(store.save());

  auto text = testing::read_all(path);
  ASSERT_TRUE(text.find("should-not-persist") == std::string::npos);

  app::ConfigStore again(path);
  ASSERT_TRUE(again.load());
  ASSERT_EQ(again.network().default_port, 9100);
  ASSERT_FALSE(again.network().enable_qr_code);
  ASSERT_EQ(again.network().max_file_size, 5ull * 1024 * 1024 * 1024);
  ASSERT_EQ(again.hotspot().ssid, "field-ap");
  ASSERT_EQ(again.hotspot().password, "lanlink123");
}

TEST(config_validate_network) {
  model::NetworkConfig n;
  ASSERT_TRUE(model::validate(n).empty());
  n.max_concurrent_transfers = 0;
  ASSERT_FALSE(model::validate(n).empty());
  n = {};
  n.default_port = 0;
  ASSERT_FALSE(model::validate(n).empty());
  n = {};
  n.session_timeout = std::chrono::seconds(-1);
  ASSERT_FALSE(model::validate(n).empty());
}

TEST(config_validate_hotspot) {
  model::HotspotConfig h;
  ASSERT_TRUE(model::validate(h).empty());
  h.password = "short";
  ASSERT_FALSE(model::validate(h).empty());
  h.security = model::HotspotSecurity::Wep;
  ASSERT_TRUE(model::validate(h).empty());  // 5 characters is a valid WEP key
  h.security = model::HotspotSecurity::Open;
  h.password.clear();
  ASSERT_TRUE(model::validate(h).empty());
  h.ssid = std::string(33, 'x');
  ASSERT_FALSE(model::validate(h).empty());
}

TEST(config_parse_security_names) {
  ASSERT_TRUE(model::parse_hotspot_security("WPA2") == model::HotspotSecurity::Wpa2);
  ASSERT_TRUE(model::parse_hotspot_security("none") == model::HotspotSecurity::Open);
  ASSERT_FALSE(model::parse_hotspot_security("wpa4").has_value());
}
