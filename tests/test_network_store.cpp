#include "minitest.hpp"
#include "fakes.hpp"
#include "platform/EncryptedNetworkStore.hpp"
#include <sys/stat.h>

using namespace lanlink;
namespace fs = std::filesystem;

namespace {

model::SavedNetwork saved(std::string ssid, std::string bssid, std::string password, int count) {
  model::SavedNetwork n;
  n.ssid = std::move(ssid);
  n.bssid = std::move(bssid);
  n.password = std::move(password);
  n.is_secure = !n.password.empty();
  n.last_connected = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
  n.connection_count = count;
  return n;
}

} // namespace

TEST(network_store_missing_file_is_empty) {
  testing::TempDir dir("store_empty");
  platform::EncryptedNetworkStore store(dir.path() / "state");
  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->empty());
}

TEST(network_store_roundtrip_keeps_fields) {
  testing::TempDir dir("store_rt");
  platform::EncryptedNetworkStore store(dir.path());
  std::vector<model::SavedNetwork> nets = {
      saved("Home Wifi = \"2.4\"", "11:22:33:44:55:66", "p@ss:word#1", 4),
      saved("Cafe", "aa:bb:cc:dd:ee:ff", "", 1),
  };
  ASSERT_TRUE(store.save(nets));
  platform::EncryptedNetworkStore again(dir.path());
  auto loaded = again.load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);
  ASSERT_EQ((*loaded)[0].ssid, "Home Wifi = \"2.4\"");
  ASSERT_EQ((*loaded)[0].password, "p@ss:word#1");
  ASSERT_TRUE((*loaded)[0].is_secure);
  ASSERT_EQ((*loaded)[0].connection_count, 4);
  ASSERT_TRUE((*loaded)[0].last_connected == nets[0].last_connected);
  ASSERT_EQ((*loaded)[1].bssid, "aa:bb:cc:dd:ee:ff");
  ASSERT_FALSE((*loaded)[1].is_secure);
}

TEST(network_store_file_does_not_contain_plaintext) {
  testing::TempDir dir("store_plain");
  platform::EncryptedNetworkStore store(dir.path());
  ASSERT_TRUE(store.save({saved("SecretNet", "11:22:33:44:55:66", "hunter2hunter2", 1)}));
  auto blob = testing::read_all(store.store_path());
  ASSERT_TRUE(blob.starts_with(platform::EncryptedNetworkStore::kMagic));
  ASSERT_TRUE(blob.find("hunter2") == std::string::npos);
  ASSERT_TRUE(blob.find("SecretNet") == std::string::npos);
  struct stat st{};
  ASSERT_EQ(::stat((dir.path() / "networks.key").c_str(), &st), 0);
  ASSERT_EQ(st.st_mode & 0777, 0600u);
}

TEST(network_store_tampered_blob_is_rejected) {
  testing::TempDir dir("store_tamper");
  platform::EncryptedNetworkStore store(dir.path());
  ASSERT_TRUE(store.save({saved("Home", "11:22:33:44:55:66", "password1", 1)}));
  auto blob = testing::read_all(store.store_path());
  blob[blob.size() - 3] ^= 0x5a;
  dir.write("networks.enc", blob);
  ASSERT_FALSE(store.load().has_value());
}

TEST(network_store_missing_key_is_rejected) {
  testing::TempDir dir("store_nokey");
  platform::EncryptedNetworkStore store(dir.path());
  ASSERT_TRUE(store.save({saved("Home", "11:22:33:44:55:66", "password1", 1)}));
  fs::remove(dir.path() / "networks.key");
  ASSERT_FALSE(store.load().has_value());
}

TEST(network_store_foreign_file_is_rejected) {
  testing::TempDir dir("store_foreign");
  dir.write("networks.enc", "[n0]\nbssid = \"x\"\n");
  platform::EncryptedNetworkStore store(dir.path());
  ASSERT_FALSE(store.load().has_value());
}

TEST(network_store_save_empty_list) {
  testing::TempDir dir("store_clear");
  platform::EncryptedNetworkStore store(dir.path());
  ASSERT_TRUE(store.save({saved("Home", "11:22:33:44:55:66", "password1", 1)}));
  ASSERT_TRUE(store.save({}));
  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->empty());
}
