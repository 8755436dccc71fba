#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>
#include "platform/Platform.hpp"
#include "util/Clock.hpp"

namespace lanlink::platform {

// Passive discovery from the kernel neighbour table (/proc/net/arp).
class ArpNeighborDiscovery final : public IDiscoveryProtocol {
public:
  static constexpr std::chrono::milliseconds kSampleInterval{5000};

  explicit ArpNeighborDiscovery(const util::Clock& clock, std::chrono::milliseconds interval = kSampleInterval);
  ~ArpNeighborDiscovery() override;
  ArpNeighborDiscovery(const ArpNeighborDiscovery&) = delete;
  ArpNeighborDiscovery& operator=(const ArpNeighborDiscovery&) = delete;

  bool start(BatchHandler on_batch) override;
  void stop() override;
  const char* name() const override { return "arp"; }

  // Complete entries only (ATF_COM); incomplete and zero-MAC rows are skipped.
  [[nodiscard]] static std::vector<model::DiscoveredDevice> parse_arp_table(std::string_view text,
                                                                           util::Clock::time_point now);

private:
  void run(std::stop_token st);

  const util::Clock& clock_;
  std::chrono::milliseconds interval_;
  BatchHandler on_batch_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::jthread thread_;
};

} // namespace lanlink::platform
