#include "util/NetIf.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace lanlink::util {

static bool usable(uint32_t host_order) {
  if (host_order == 0) return false;
  if ((host_order >> 24) == 127) return false;
  if ((host_order >> 16) == ((169u << 8) | 254u)) return false;
  return true;
}

bool is_lan_ipv4(std::string_view dotted) {
  std::string s(dotted);
  in_addr addr{};
  if (::inet_pton(AF_INET, s.c_str(), &addr) != 1) return false;
  return usable(ntohl(addr.s_addr));
}

std::optional<std::string> first_lan_ipv4() {
  struct ifaddrs* ifs = nullptr;
  if (::getifaddrs(&ifs) != 0) {
    std::fprintf(stderr, "lanlink: netif: getifaddrs() failed: %s\n", std::strerror(errno));
    return std::nullopt;
  }
  std::optional<std::string> found;
  for (auto* it = ifs; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;
    auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    if (!usable(ntohl(sin->sin_addr.s_addr))) continue;
    char buf[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) { found = buf; break; }
  }
  ::freeifaddrs(ifs);
  return found;
}

} // namespace lanlink::util
