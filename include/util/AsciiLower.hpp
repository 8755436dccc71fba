#pragma once

#include <array>
#include <string>
#include <string_view>

namespace lanlink::util {

inline constexpr std::array<char, 256> kAsciiLower = [] {
  std::array<char, 256> t{};
  for (int i = 0; i < 256; ++i)
    t[i] = static_cast<char>((i >= 'A' && i <= 'Z') ? i + ('a' - 'A') : i);
  return t;
}();

[[nodiscard]] constexpr char ascii_lower(unsigned char c) { return kAsciiLower[c]; }

[[nodiscard]] inline std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (ascii_lower(static_cast<unsigned char>(a[i])) != ascii_lower(static_cast<unsigned char>(b[i]))) return false;
  return true;
}

} // namespace lanlink::util
