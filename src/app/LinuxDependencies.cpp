#include "app/Coordinator.hpp"
#include "platform/ArpNeighborDiscovery.hpp"
#include "platform/EncryptedNetworkStore.hpp"
#include "platform/LinuxPermissionBroker.hpp"
#include "platform/NetlinkConnectivitySource.hpp"
#include "platform/Nmcli.hpp"
#include "platform/ProcMetricsProvider.hpp"
#include "util/NetIf.hpp"

namespace lanlink::app {

Dependencies make_linux_dependencies() {
  Dependencies d;
  d.clock = std::make_shared<util::SystemClock>();
  d.wifi = std::make_unique<platform::NmcliWifiPlatform>();
  d.hotspot = std::make_unique<platform::NmcliHotspotPlatform>();
  d.metrics = std::make_unique<platform::ProcMetricsProvider>();
  d.permissions = std::make_unique<platform::LinuxPermissionBroker>();
  d.connectivity = std::make_unique<platform::NetlinkConnectivitySource>();
  d.discovery = std::make_unique<platform::ArpNeighborDiscovery>(*d.clock);
  d.saved_networks = std::make_unique<platform::EncryptedNetworkStore>();
  d.http = std::make_unique<HttpListener>();
  d.http_client = std::make_unique<TcpHttpClient>();
  d.config = std::make_unique<ConfigStore>();
  d.address_resolver = [] { return util::first_lan_ipv4(); };
  d.upload_dir = platform::EncryptedNetworkStore::default_dir() / "uploads";
  return d;
}

} // namespace lanlink::app
