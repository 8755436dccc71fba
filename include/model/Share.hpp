#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lanlink::model {

struct SharedFileEntry {
  std::string id;
  std::filesystem::path path;
  std::string name;
  uint64_t size{};
  std::optional<std::string> password_hash;  // encoded PBKDF2 record, never the password
  std::optional<std::chrono::system_clock::time_point> expires_at;
  std::chrono::system_clock::time_point created_at{};
  std::string url;
  std::optional<std::string> qr_payload;  // text the QR symbol encodes (the url)
  std::optional<std::string> qr_image;    // SVG rendering of qr_payload
  uint64_t download_count{};

  [[nodiscard]] bool requires_password() const { return password_hash.has_value(); }
  [[nodiscard]] bool expired(std::chrono::system_clock::time_point now) const {
    return expires_at && now >= *expires_at;
  }
};

} // namespace lanlink::model
