#pragma once
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include "platform/Platform.hpp"

namespace lanlink::platform {

// rtnetlink link/address notifications. A burst of messages is coalesced
// into one callback carrying the kind re-derived from /sys/class/net.
class NetlinkConnectivitySource final : public IConnectivitySource {
public:
  NetlinkConnectivitySource() = default;
  ~NetlinkConnectivitySource() override;
  NetlinkConnectivitySource(const NetlinkConnectivitySource&) = delete;
  NetlinkConnectivitySource& operator=(const NetlinkConnectivitySource&) = delete;

  bool start(Listener listener) override;
  void stop() override;
  model::ConnectivityKind current() override { return scan_interfaces(); }

  // Kind of one /sys/class/net entry; nullopt for loopback and virtual bridges.
  [[nodiscard]] static std::optional<model::ConnectivityKind> classify_interface(const std::string& name);
  // Best kind among interfaces whose operstate is up.
  [[nodiscard]] static model::ConnectivityKind scan_interfaces();

private:
  void event_loop(std::stop_token st);

  Listener listener_;
  int nl_sock_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
  std::mutex mu_;
};

} // namespace lanlink::platform
