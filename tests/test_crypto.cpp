#include "minitest.hpp"
#include "util/Crypto.hpp"
#include <set>
#include <string>

using namespace lanlink;

TEST(crypto_random_id_is_uuid_v4) {
  auto id = util::random_id();
  ASSERT_EQ(id.size(), 36u);
  ASSERT_EQ(id[8], '-');
  ASSERT_EQ(id[13], '-');
  ASSERT_EQ(id[14], '4');
  ASSERT_EQ(id[18], '-');
  ASSERT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
  ASSERT_EQ(id[23], '-');
}

TEST(crypto_random_ids_unique) {
  std::set<std::string> ids;
  for (int i = 0; i < 500; ++i) ids.insert(util::random_id());
  ASSERT_EQ(ids.size(), 500u);
}

TEST(crypto_hex) {
  ASSERT_EQ(util::to_hex(std::string_view("\x01\xab", 2)), "01ab");
  auto b = util::from_hex("01AB");
  ASSERT_TRUE(b.has_value());
  ASSERT_EQ(b->size(), 2u);
  ASSERT_EQ((*b)[1], 0xab);
  ASSERT_FALSE(util::from_hex("abc").has_value());
  ASSERT_FALSE(util::from_hex("zz").has_value());
}

TEST(crypto_password_hash_verifies) {
  auto h = util::hash_password("open sesame", 1000);
  ASSERT_TRUE(h.has_value());
  ASSERT_TRUE(h->starts_with("pbkdf2-sha256$1000$"));
  ASSERT_TRUE(h->find("open sesame") == std::string::npos);
  ASSERT_TRUE(util::verify_password("open sesame", *h));
  ASSERT_FALSE(util::verify_password("open sesame!", *h));
  ASSERT_FALSE(util::verify_password("", *h));
}

TEST(crypto_password_hash_is_salted) {
  auto a = util::hash_password("same", 1000);
  auto b = util::hash_password("same", 1000);
  ASSERT_TRUE(a && b);
  ASSERT_NE(*a, *b);
}

TEST(crypto_verify_rejects_malformed_records) {
  ASSERT_FALSE(util::verify_password("x", ""));
  ASSERT_FALSE(util::verify_password("x", "pbkdf2-sha256$1000$zz$00"));
  ASSERT_FALSE(util::verify_password("x", "md5$1000$00$00"));
}

TEST(crypto_seal_unseal) {
  auto key = util::random_bytes(util::kSealKeyBytes);
  ASSERT_TRUE(key.has_value());
  auto sealed = util::seal(*key, "wifi password: hunter2");
  ASSERT_TRUE(sealed.has_value());
  auto plain = util::unseal(*key, *sealed);
  ASSERT_TRUE(plain.has_value());
  ASSERT_EQ(*plain, "wifi password: hunter2");
}

TEST(crypto_unseal_detects_tamper_and_wrong_key) {
  auto key = util::random_bytes(util::kSealKeyBytes);
  auto other = util::random_bytes(util::kSealKeyBytes);
  ASSERT_TRUE(key && other);
  auto sealed = util::seal(*key, "payload");
  ASSERT_TRUE(sealed.has_value());
  ASSERT_FALSE(util::unseal(*other, *sealed).has_value());
  auto bad = *sealed;
  bad.back() ^= 0x01;
  ASSERT_FALSE(util::unseal(*key, bad).has_value());
  util::Bytes short_key(16, 0);
  ASSERT_FALSE(util::seal(short_key, "x").has_value());
}
