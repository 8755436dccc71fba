#include "platform/NetlinkConnectivitySource.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <poll.h>
#include <unistd.h>

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>

namespace lanlink::platform {

namespace {

constexpr int kCoalesceMs = 250;

// Higher is preferred when several interfaces are up.
int rank(model::ConnectivityKind k) {
  switch (k) {
    case model::ConnectivityKind::Wifi: return 5;
    case model::ConnectivityKind::Ethernet: return 4;
    case model::ConnectivityKind::Mobile: return 3;
    case model::ConnectivityKind::Vpn: return 2;
    case model::ConnectivityKind::Other: return 1;
    case model::ConnectivityKind::None: return 0;
  }
  return 0;
}

bool has_prefix(const std::string& s, std::initializer_list<const char*> prefixes) {
  for (const char* p : prefixes)
    if (s.starts_with(p)) return true;
  return false;
}

void drain(int fd) {
  char buf[8192];
  while (::recv(fd, buf, sizeof(buf), MSG_DONTWAIT) > 0) {}
}

} // namespace

NetlinkConnectivitySource::~NetlinkConnectivitySource() { stop(); }

std::optional<model::ConnectivityKind> NetlinkConnectivitySource::classify_interface(const std::string& name) {
  if (name.empty() || name == "lo") return std::nullopt;
  if (has_prefix(name, {"docker", "veth", "br-", "virbr", "vmnet", "lxc"})) return std::nullopt;
  const std::string base = "/sys/class/net/" + name;
  if (lanlink::util::path_exists(base + "/wireless") || lanlink::util::path_exists(base + "/phy80211"))
    return model::ConnectivityKind::Wifi;
  if (has_prefix(name, {"tun", "tap", "wg"})) return model::ConnectivityKind::Vpn;
  if (has_prefix(name, {"wwan", "rmnet", "ppp"})) return model::ConnectivityKind::Mobile;
  // Physical NICs expose their bus device; pure virtual links do not.
  if (lanlink::util::path_exists(base + "/device")) return model::ConnectivityKind::Ethernet;
  return model::ConnectivityKind::Other;
}

model::ConnectivityKind NetlinkConnectivitySource::scan_interfaces() {
  model::ConnectivityKind best = model::ConnectivityKind::None;
  for (const auto& name : lanlink::util::list_dir("/sys/class/net")) {
    auto kind = classify_interface(name);
    if (!kind) continue;
    auto state = lanlink::util::read_first_line("/sys/class/net/" + name + "/operstate");
    if (!state || (*state != "up" && *state != "unknown")) continue;
    // "unknown" is what tun devices report while passing traffic; other
    // kinds only count with carrier.
    if (*state == "unknown" && *kind != model::ConnectivityKind::Vpn) {
      auto carrier = lanlink::util::read_first_line("/sys/class/net/" + name + "/carrier");
      if (!carrier || *carrier != "1") continue;
    }
    if (rank(*kind) > rank(best)) best = *kind;
  }
  return best;
}

bool NetlinkConnectivitySource::start(Listener listener) {
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return true;

  nl_sock_ = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE);
  if (nl_sock_ < 0) {
    std::fprintf(stderr, "lanlink: netlink: socket() failed: %s\n", std::strerror(errno));
    return false;
  }
  struct sockaddr_nl addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.nl_family = AF_NETLINK;
  addr.nl_groups = RTMGRP_LINK | RTMGRP_IPV4_IFADDR;
  if (::bind(nl_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "lanlink: netlink: bind() failed: %s\n", std::strerror(errno));
    ::close(nl_sock_);
    nl_sock_ = -1;
    return false;
  }
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "lanlink: netlink: eventfd() failed: %s\n", std::strerror(errno));
    ::close(nl_sock_);
    nl_sock_ = -1;
    return false;
  }
  listener_ = std::move(listener);
  thread_ = std::jthread([this](std::stop_token st) { event_loop(st); });
  return true;
}

void NetlinkConnectivitySource::stop() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!thread_.joinable()) return;
  uint64_t one = 1;
  (void)::write(stop_eventfd_, &one, sizeof(one));
  thread_.request_stop();
  thread_.join();
  thread_ = std::jthread{};
  ::close(stop_eventfd_);
  stop_eventfd_ = -1;
  ::close(nl_sock_);
  nl_sock_ = -1;
}

void NetlinkConnectivitySource::event_loop(std::stop_token st) {
  struct pollfd fds[2] = {{nl_sock_, POLLIN, 0}, {stop_eventfd_, POLLIN, 0}};
  while (!st.stop_requested()) {
    int n = ::poll(fds, 2, -1);
    if (n < 0) {
      if (errno == EINTR) continue;
      std::fprintf(stderr, "lanlink: netlink: poll() failed: %s\n", std::strerror(errno));
      break;
    }
    if (fds[1].revents & POLLIN) break;
    if (!(fds[0].revents & POLLIN)) continue;

    // Coalesce a burst (link down, address removed, route flush...)
    drain(nl_sock_);
    for (;;) {
      struct pollfd more[2] = {{nl_sock_, POLLIN, 0}, {stop_eventfd_, POLLIN, 0}};
      int m = ::poll(more, 2, kCoalesceMs);
      if (m <= 0 || (more[1].revents & POLLIN)) break;
      drain(nl_sock_);
    }
    if (st.stop_requested()) break;

    try {
      listener_(scan_interfaces());
    } catch (const std::exception& e) {
      std::fprintf(stderr, "lanlink: netlink: listener failed: %s\n", e.what());
    }
  }
}

} // namespace lanlink::platform
