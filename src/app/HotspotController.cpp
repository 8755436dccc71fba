#include "app/HotspotController.hpp"

#include <cstdio>
#include <exception>

namespace lanlink::app {

HotspotController::HotspotController(EventChannel& events, platform::IHotspotPlatform& platform,
                                     Scheduler& scheduler)
    : events_(events), platform_(platform), scheduler_(scheduler) {}

HotspotController::~HotspotController() {
  std::lock_guard<std::mutex> lk(mu_);
  if (timeout_task_) scheduler_.cancel(timeout_task_);
}

void HotspotController::set_config(const model::HotspotConfig& cfg) {
  std::lock_guard<std::mutex> lk(mu_);
  config_ = cfg;
}

model::HotspotConfig HotspotController::config() const {
  std::lock_guard<std::mutex> lk(mu_);
  return config_;
}

bool HotspotController::enabled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return enabled_;
}

void HotspotController::fail(const std::string& message) {
  std::fprintf(stderr, "lanlink: hotspot: %s\n", message.c_str());
  events_.publish(model::events::Error{model::ErrorKind::HotspotError, message});
}

bool HotspotController::enable(const std::optional<std::string>& ssid, const std::optional<std::string>& password,
                               model::HotspotSecurity security) {
  std::lock_guard<std::mutex> op(op_mu_);
  model::HotspotConfig merged;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (enabled_) return true;
    merged = config_;
  }
  if (ssid) merged.ssid = *ssid;
  if (password) merged.password = *password;
  merged.security = security;
  if (auto why = model::validate(merged); !why.empty()) {
    fail(why);
    return false;
  }

  std::string why;
  bool started = false;
  try {
    started = platform_.start_access_point(merged, &why);
  } catch (const std::exception& e) {
    why = e.what();
  }
  if (!started) {
    fail(std::string(platform_.name()) + " could not start access point " + merged.ssid +
         (why.empty() ? std::string() : ": " + why));
    return false;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    config_ = merged;
    enabled_ = true;
    if (merged.timeout.count() > 0) {
      timeout_task_ = scheduler_.schedule_after("hotspot-timeout", merged.timeout, [this] {
        std::fprintf(stderr, "lanlink: hotspot: timeout reached, disabling\n");
        (void)disable();
      });
    }
  }
  std::fprintf(stderr, "lanlink: hotspot: %s up (%s)\n", merged.ssid.c_str(), model::to_string(merged.security));
  events_.publish(model::events::HotspotEnabled{});
  return true;
}

bool HotspotController::disable() {
  std::lock_guard<std::mutex> op(op_mu_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!enabled_) return true;
    if (timeout_task_) {
      scheduler_.cancel(timeout_task_);
      timeout_task_ = 0;
    }
  }

  std::string why;
  bool stopped = false;
  try {
    stopped = platform_.stop_access_point(&why);
  } catch (const std::exception& e) {
    why = e.what();
  }
  if (!stopped) {
    fail(std::string(platform_.name()) + " could not stop the access point" +
         (why.empty() ? std::string() : ": " + why));
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    enabled_ = false;
  }
  events_.publish(model::events::HotspotDisabled{});
  return true;
}

} // namespace lanlink::app
