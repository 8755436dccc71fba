#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include "model/Statistics.hpp"
#include "model/Transfer.hpp"
#include "model/Wifi.hpp"

namespace lanlink::model {

enum class ErrorKind {
  PermissionDenied,
  ScanFailed,
  ConnectionFailed,
  DiscoveryFailed,
  SharingServerError,
  TransferFailed,
  HotspotError,
  ConfigError,
  NotInitialized,
};

[[nodiscard]] const char* to_string(ErrorKind k);

// One struct per event; the variant below is closed.
namespace events {

struct Initialized {};
struct ConfigUpdated {};
struct ConnectivityChanged { ConnectivityKind kind{}; };
struct NetworksScanned { size_t count{}; };
struct Connecting { std::string ssid; };
struct Connected { std::string ssid; };
struct Disconnecting { std::string ssid; };
struct Disconnected {};
struct PermissionDenied { Permission permission{}; };
struct DiscoveryStarted {};
struct DiscoveryStopped {};
struct DevicesDiscovered { size_t count{}; };
struct SharingServerStarted { uint16_t port{}; };
struct SharingServerStopped {};
struct FileShared { std::string path; std::string share_id; };
struct QrCodeGenerated { std::string share_id; };
struct HotspotEnabled {};
struct HotspotDisabled {};
struct NetworksSaved { size_t count{}; };
struct Error { ErrorKind kind{}; std::string message; };
struct TransferStarted { std::string transfer_id; TransferDirection direction{}; std::string file_name; };
struct TransferProgress {
  std::string transfer_id;
  uint64_t transferred_bytes{};
  uint64_t total_bytes{};
  double bytes_per_second{};
};
struct TransferFinished { std::string transfer_id; TransferState state{}; };
struct PerformanceUpdated { PerformanceSnapshot snapshot; };

} // namespace events

using NetworkEvent = std::variant<
  events::Initialized,
  events::ConfigUpdated,
  events::ConnectivityChanged,
  events::NetworksScanned,
  events::Connecting,
  events::Connected,
  events::Disconnecting,
  events::Disconnected,
  events::PermissionDenied,
  events::DiscoveryStarted,
  events::DiscoveryStopped,
  events::DevicesDiscovered,
  events::SharingServerStarted,
  events::SharingServerStopped,
  events::FileShared,
  events::QrCodeGenerated,
  events::HotspotEnabled,
  events::HotspotDisabled,
  events::NetworksSaved,
  events::Error,
  events::TransferStarted,
  events::TransferProgress,
  events::TransferFinished,
  events::PerformanceUpdated>;

// Stable lower_snake name, e.g. "networks_scanned".
[[nodiscard]] const char* event_name(const NetworkEvent& ev);
// One-line human readable rendering including the payload.
[[nodiscard]] std::string describe(const NetworkEvent& ev);

} // namespace lanlink::model
