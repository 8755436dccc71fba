#pragma once
#include <mutex>
#include <optional>
#include <string>
#include "app/EventChannel.hpp"
#include "app/Scheduler.hpp"
#include "model/Config.hpp"
#include "platform/Platform.hpp"

namespace lanlink::app {

// Device-hosted access point. Whether it may coexist with a client link is
// left to the platform backend.
class HotspotController {
public:
  HotspotController(EventChannel& events, platform::IHotspotPlatform& platform, Scheduler& scheduler);
  ~HotspotController();
  HotspotController(const HotspotController&) = delete;
  HotspotController& operator=(const HotspotController&) = delete;

  // Base config the overrides are merged into.
  void set_config(const model::HotspotConfig& cfg);
  [[nodiscard]] model::HotspotConfig config() const;

  // No-op success when already enabled.
  bool enable(const std::optional<std::string>& ssid, const std::optional<std::string>& password,
              model::HotspotSecurity security);
  // No-op success when already disabled.
  bool disable();
  [[nodiscard]] bool enabled() const;

private:
  void fail(const std::string& message);

  EventChannel& events_;
  platform::IHotspotPlatform& platform_;
  Scheduler& scheduler_;

  std::mutex op_mu_;
  mutable std::mutex mu_;
  model::HotspotConfig config_{};
  bool enabled_{false};
  Scheduler::TaskId timeout_task_{0};
};

} // namespace lanlink::app
