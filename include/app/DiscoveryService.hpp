#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>
#include "app/EventChannel.hpp"
#include "app/Scheduler.hpp"
#include "model/Device.hpp"
#include "platform/Platform.hpp"
#include "util/Clock.hpp"

namespace lanlink::app {

// Owns the discovered-device registry. Batches from the protocol replace it
// wholesale; a periodic sweep evicts devices not seen within the threshold.
class DiscoveryService {
public:
  static constexpr std::chrono::minutes kStalenessThreshold{5};
  static constexpr std::chrono::seconds kPruneInterval{10};

  DiscoveryService(EventChannel& events, platform::IDiscoveryProtocol& protocol,
                   Scheduler& scheduler, const util::Clock& clock);
  ~DiscoveryService();
  DiscoveryService(const DiscoveryService&) = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  bool start();
  void stop();
  [[nodiscard]] bool running() const;

  [[nodiscard]] std::vector<model::DiscoveredDevice> devices() const;

  // Removes stale devices; returns how many were evicted.
  size_t prune();

private:
  void apply_batch(uint64_t generation, std::vector<model::DiscoveredDevice> batch);

  EventChannel& events_;
  platform::IDiscoveryProtocol& protocol_;
  Scheduler& scheduler_;
  const util::Clock& clock_;

  std::mutex lifecycle_mu_;
  mutable std::mutex mu_;     // registry, running flag, generation
  std::vector<model::DiscoveredDevice> devices_;
  bool running_{false};
  uint64_t generation_{0};    // batches from an earlier run are dropped
  Scheduler::TaskId prune_task_{0};
};

} // namespace lanlink::app
