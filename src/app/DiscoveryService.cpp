#include "app/DiscoveryService.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace lanlink::app {

DiscoveryService::DiscoveryService(EventChannel& events, platform::IDiscoveryProtocol& protocol,
                                   Scheduler& scheduler, const util::Clock& clock)
    : events_(events), protocol_(protocol), scheduler_(scheduler), clock_(clock) {}

DiscoveryService::~DiscoveryService() { stop(); }

bool DiscoveryService::start() {
  std::lock_guard<std::mutex> life(lifecycle_mu_);
  uint64_t gen = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return true;
    devices_.clear();
    running_ = true;
    gen = ++generation_;
  }

  bool started = false;
  std::string why;
  try {
    started = protocol_.start([this, gen](std::vector<model::DiscoveredDevice> batch) {
      apply_batch(gen, std::move(batch));
    });
  } catch (const std::exception& e) {
    why = e.what();
  }
  if (!started) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      running_ = false;
    }
    std::string msg = std::string(protocol_.name()) + " discovery could not start";
    if (!why.empty()) msg += ": " + why;
    std::fprintf(stderr, "lanlink: discovery: %s\n", msg.c_str());
    events_.publish(model::events::Error{model::ErrorKind::DiscoveryFailed, msg});
    return false;
  }

  prune_task_ = scheduler_.schedule_every("discovery-prune", kPruneInterval, [this] { (void)prune(); });
  events_.publish(model::events::DiscoveryStarted{});
  return true;
}

void DiscoveryService::stop() {
  std::lock_guard<std::mutex> life(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return;
  }
  scheduler_.cancel(prune_task_);
  prune_task_ = 0;
  protocol_.stop();
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
  }
  events_.publish(model::events::DiscoveryStopped{});
}

bool DiscoveryService::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return running_;
}

std::vector<model::DiscoveredDevice> DiscoveryService::devices() const {
  std::lock_guard<std::mutex> lk(mu_);
  return devices_;
}

void DiscoveryService::apply_batch(uint64_t generation, std::vector<model::DiscoveredDevice> batch) {
  size_t count = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_ || generation != generation_) return;
    auto now = clock_.now();
    std::erase_if(batch, [&](const auto& d) { return now - d.last_seen > kStalenessThreshold; });
    devices_ = std::move(batch);
    count = devices_.size();
  }
  events_.publish(model::events::DevicesDiscovered{count});
}

size_t DiscoveryService::prune() {
  size_t removed = 0, left = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = clock_.now();
    removed = std::erase_if(devices_, [&](const auto& d) { return now - d.last_seen > kStalenessThreshold; });
    left = devices_.size();
  }
  if (removed > 0) events_.publish(model::events::DevicesDiscovered{left});
  return removed;
}

} // namespace lanlink::app
