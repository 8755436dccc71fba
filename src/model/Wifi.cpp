#include "model/Wifi.hpp"
#include "util/AsciiLower.hpp"

namespace lanlink::model {

static bool is_separator(char c) {
  return c == ' ' || c == '\t' || c == '[' || c == ']' || c == '-' || c == '+' || c == ',' || c == '/';
}

static bool secure_token(std::string_view tok) {
  auto t = util::ascii_lower(tok);
  if (t.starts_with("wpa") || t.starts_with("wep")) return true;
  return t == "rsn" || t == "psk" || t == "sae" || t == "eap" || t == "802.1x";
}

bool capabilities_are_secure(std::string_view caps) {
  size_t i = 0;
  while (i < caps.size()) {
    while (i < caps.size() && is_separator(caps[i])) ++i;
    size_t j = i;
    while (j < caps.size() && !is_separator(caps[j])) ++j;
    if (j > i && secure_token(caps.substr(i, j - i))) return true;
    i = j;
  }
  return false;
}

} // namespace lanlink::model
