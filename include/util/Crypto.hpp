#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanlink::util {

using Bytes = std::vector<unsigned char>;

inline constexpr int kPbkdf2Iterations = 100000;
inline constexpr size_t kSealKeyBytes = 32;

// Bytes from the OpenSSL CSPRNG; nullopt if it is not seeded.
[[nodiscard]] std::optional<Bytes> random_bytes(size_t n);

// RFC 4122 version 4 id, e.g. "3f2b...-4...". Empty if the CSPRNG fails.
[[nodiscard]] std::string random_id();

[[nodiscard]] std::string to_hex(const unsigned char* data, size_t n);
[[nodiscard]] std::string to_hex(std::string_view s);
[[nodiscard]] std::optional<Bytes> from_hex(std::string_view hex);

// "pbkdf2-sha256$<iterations>$<salt hex>$<digest hex>"
[[nodiscard]] std::optional<std::string> hash_password(std::string_view password,
                                                       int iterations = kPbkdf2Iterations);
// Constant-time comparison against a record produced by hash_password.
[[nodiscard]] bool verify_password(std::string_view password, std::string_view encoded);

// AES-256-GCM. Output layout: 12-byte IV, 16-byte tag, ciphertext.
[[nodiscard]] std::optional<Bytes> seal(const Bytes& key, std::string_view plaintext);
// nullopt on a wrong key or any tampering.
[[nodiscard]] std::optional<std::string> unseal(const Bytes& key, const Bytes& sealed);

} // namespace lanlink::util
