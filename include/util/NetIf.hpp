#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace lanlink::util {

// Dotted-quad that is neither loopback (127/8), link-local (169.254/16) nor 0.0.0.0.
[[nodiscard]] bool is_lan_ipv4(std::string_view dotted);

// First such address on an interface that is up. nullopt if none.
[[nodiscard]] std::optional<std::string> first_lan_ipv4();

} // namespace lanlink::util
