#include "util/Crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <charconv>
#include <climits>
#include <memory>

namespace lanlink::util {

namespace {

constexpr size_t kSaltBytes = 16;
constexpr size_t kDigestBytes = 32;
constexpr size_t kIvBytes = 12;
constexpr size_t kTagBytes = 16;
constexpr std::string_view kScheme = "pbkdf2-sha256";

struct CipherCtxFree {
  void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree>;

std::optional<Bytes> pbkdf2(std::string_view password, const Bytes& salt, int iterations) {
  Bytes out(kDigestBytes);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()), iterations,
                        EVP_sha256(), static_cast<int>(out.size()), out.data()) != 1)
    return std::nullopt;
  return out;
}

} // namespace

std::optional<Bytes> random_bytes(size_t n) {
  if (n > static_cast<size_t>(INT_MAX)) return std::nullopt;
  Bytes out(n);
  if (n == 0) return out;
  if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) return std::nullopt;
  return out;
}

std::string random_id() {
  auto b = random_bytes(16);
  if (!b) return {};
  auto& r = *b;
  r[6] = static_cast<unsigned char>((r[6] & 0x0f) | 0x40);
  r[8] = static_cast<unsigned char>((r[8] & 0x3f) | 0x80);
  std::string hex = to_hex(r.data(), r.size());
  return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
         hex.substr(16, 4) + '-' + hex.substr(20);
}

std::string to_hex(const unsigned char* data, size_t n) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (size_t i = 0; i < n; ++i) {
    out += digits[data[i] >> 4];
    out += digits[data[i] & 0x0f];
  }
  return out;
}

std::string to_hex(std::string_view s) {
  return to_hex(reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

std::optional<Bytes> from_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]), lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<unsigned char>(hi * 16 + lo));
  }
  return out;
}

std::optional<std::string> hash_password(std::string_view password, int iterations) {
  if (iterations < 1) return std::nullopt;
  auto salt = random_bytes(kSaltBytes);
  if (!salt) return std::nullopt;
  auto digest = pbkdf2(password, *salt, iterations);
  if (!digest) return std::nullopt;
  std::string out(kScheme);
  out += '$';
  out += std::to_string(iterations);
  out += '$';
  out += to_hex(salt->data(), salt->size());
  out += '$';
  out += to_hex(digest->data(), digest->size());
  return out;
}

bool verify_password(std::string_view password, std::string_view encoded) {
  // scheme$iterations$salt$digest
  std::string_view parts[4];
  size_t start = 0;
  for (int i = 0; i < 4; ++i) {
    size_t end = (i == 3) ? encoded.size() : encoded.find('$', start);
    if (end == std::string_view::npos) return false;
    parts[i] = encoded.substr(start, end - start);
    start = end + 1;
  }
  if (parts[0] != kScheme) return false;
  int iterations = 0;
  auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(), iterations);
  if (ec != std::errc{} || ptr != parts[1].data() + parts[1].size() || iterations < 1) return false;
  auto salt = from_hex(parts[2]);
  auto expected = from_hex(parts[3]);
  if (!salt || !expected || expected->size() != kDigestBytes) return false;
  auto actual = pbkdf2(password, *salt, iterations);
  if (!actual) return false;
  return CRYPTO_memcmp(actual->data(), expected->data(), kDigestBytes) == 0;
}

std::optional<Bytes> seal(const Bytes& key, std::string_view plaintext) {
  if (key.size() != kSealKeyBytes || plaintext.size() > static_cast<size_t>(INT_MAX)) return std::nullopt;
  auto iv = random_bytes(kIvBytes);
  if (!iv) return std::nullopt;
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) return std::nullopt;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) return std::nullopt;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvBytes), nullptr) != 1) return std::nullopt;
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv->data()) != 1) return std::nullopt;

  Bytes out(kIvBytes + kTagBytes + plaintext.size() + 16);
  std::copy(iv->begin(), iv->end(), out.begin());
  unsigned char* ct = out.data() + kIvBytes + kTagBytes;
  int len = 0, total = 0;
  if (EVP_EncryptUpdate(ctx.get(), ct, &len, reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) return std::nullopt;
  total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), ct + total, &len) != 1) return std::nullopt;
  total += len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes),
                          out.data() + kIvBytes) != 1) return std::nullopt;
  out.resize(kIvBytes + kTagBytes + static_cast<size_t>(total));
  return out;
}

std::optional<std::string> unseal(const Bytes& key, const Bytes& sealed) {
  if (key.size() != kSealKeyBytes || sealed.size() < kIvBytes + kTagBytes) return std::nullopt;
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) return std::nullopt;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) return std::nullopt;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvBytes), nullptr) != 1) return std::nullopt;
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.data()) != 1) return std::nullopt;

  const unsigned char* ct = sealed.data() + kIvBytes + kTagBytes;
  size_t ct_len = sealed.size() - kIvBytes - kTagBytes;
  std::string out(ct_len + 16, '\0');
  int len = 0, total = 0;
  if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &len, ct,
                        static_cast<int>(ct_len)) != 1) return std::nullopt;
  total = len;
  Bytes tag(sealed.begin() + kIvBytes, sealed.begin() + kIvBytes + kTagBytes);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes), tag.data()) != 1)
    return std::nullopt;
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + total, &len) != 1)
    return std::nullopt;
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

} // namespace lanlink::util
