#include "minitest.hpp"
#include "fakes.hpp"
#include "app/DiscoveryService.hpp"
#include "app/Scheduler.hpp"
#include "platform/ArpNeighborDiscovery.hpp"
#include <atomic>
#include <filesystem>
#include <thread>

using namespace lanlink;
using namespace std::chrono_literals;

struct DiscoveryFixture {
  app::EventChannel ch;
  testing::EventRecorder rec{ch};
  util::ManualClock clock;
  app::Scheduler scheduler{clock};
  testing::FakeDiscoveryProtocol protocol;
  app::DiscoveryService service{ch, protocol, scheduler, clock};
};

TEST(discovery_batch_replaces_registry) {
  DiscoveryFixture f;
  ASSERT_TRUE(f.service.start());
  ASSERT_EQ(f.rec.count("discovery_started"), 1u);
  auto now = f.clock.now();
  f.protocol.push({testing::device("a", "192.168.1.2", now), testing::device("b", "192.168.1.3", now),
                   testing::device("c", "192.168.1.4", now)});
  ASSERT_EQ(f.service.devices().size(), 3u);
  f.protocol.push({testing::device("b", "192.168.1.3", now)});
  auto devs = f.service.devices();
  ASSERT_EQ(devs.size(), 1u);
  ASSERT_EQ(devs[0].id, "b");
  ASSERT_EQ(f.rec.count("devices_discovered"), 2u);
}

TEST(discovery_prune_evicts_stale_devices) {
  DiscoveryFixture f;
  ASSERT_TRUE(f.service.start());
  auto now = f.clock.now();
  f.protocol.push({testing::device("a", "10.0.0.2", now), testing::device("b", "10.0.0.3", now),
                   testing::device("c", "10.0.0.4", now)});
  f.clock.advance(6min);
  ASSERT_EQ(f.service.prune(), 3u);
  ASSERT_TRUE(f.service.devices().empty());
  ASSERT_EQ(f.service.prune(), 0u);
}

TEST(discovery_prune_runs_on_scheduler) {
  DiscoveryFixture f;
  ASSERT_TRUE(f.service.start());
  f.protocol.push({testing::device("a", "10.0.0.2", f.clock.now())});
  f.clock.advance(4min);
  (void)f.scheduler.run_due();
  ASSERT_EQ(f.service.devices().size(), 1u);
  f.clock.advance(2min);
  (void)f.scheduler.run_due();
  ASSERT_TRUE(f.service.devices().empty());
}

TEST(discovery_batch_drops_entries_already_stale) {
  DiscoveryFixture f;
  ASSERT_TRUE(f.service.start());
  auto now = f.clock.now();
  f.protocol.push({testing::device("old", "10.0.0.9", now - 10min), testing::device("new", "10.0.0.8", now)});
  auto devs = f.service.devices();
  ASSERT_EQ(devs.size(), 1u);
  ASSERT_EQ(devs[0].id, "new");
}

TEST(discovery_start_is_idempotent_and_stop_clears_task) {
  DiscoveryFixture f;
  ASSERT_TRUE(f.service.start());
  ASSERT_TRUE(f.service.start());
  ASSERT_EQ(f.rec.count("discovery_started"), 1u);
  ASSERT_EQ(f.scheduler.pending(), 1u);
  f.service.stop();
  f.service.stop();
  ASSERT_EQ(f.rec.count("discovery_stopped"), 1u);
  ASSERT_EQ(f.scheduler.pending(), 0u);
  ASSERT_FALSE(f.protocol.active());
}

TEST(discovery_protocol_failure) {
  DiscoveryFixture f;
  f.protocol.start_ok = false;
  ASSERT_FALSE(f.service.start());
  ASSERT_FALSE(f.service.running());
  ASSERT_EQ(f.rec.errors(model::ErrorKind::DiscoveryFailed), 1u);
  ASSERT_EQ(f.rec.count("discovery_started"), 0u);
}

TEST(discovery_restart_clears_previous_registry) {
  DiscoveryFixture f;
  ASSERT_TRUE(f.service.start());
  f.protocol.push({testing::device("a", "10.0.0.2", f.clock.now())});
  f.service.stop();
  ASSERT_TRUE(f.service.start());
  ASSERT_TRUE(f.service.devices().empty());
}

TEST(discovery_arp_table_parsing) {
  util::ManualClock clock;
  const char* table =
      "IP address       HW type     Flags       HW address            Mask     Device\n"
      "192.168.1.1      0x1         0x2         AA:BB:CC:00:11:22     *        wlp2s0\n"
      "192.168.1.50     0x1         0x0         00:00:00:00:00:00     *        wlp2s0\n"
      "192.168.1.51     0x1         0x2         00:00:00:00:00:00     *        wlp2s0\n"
      "10.0.0.5         0x1         0x6         de:ad:be:ef:00:01     *        enp3s0\n";
  auto devs = platform::ArpNeighborDiscovery::parse_arp_table(table, clock.now());
  ASSERT_EQ(devs.size(), 2u);
  ASSERT_EQ(devs[0].id, "aa:bb:cc:00:11:22");
  ASSERT_EQ(devs[0].ip_address, "192.168.1.1");
  ASSERT_EQ(devs[0].metadata.at("iface"), "wlp2s0");
  ASSERT_TRUE(devs[0].last_seen == clock.now());
  ASSERT_EQ(devs[1].ip_address, "10.0.0.5");
  ASSERT_TRUE(platform::ArpNeighborDiscovery::parse_arp_table("", clock.now()).empty());
}

TEST(discovery_stop_from_handler_joins_arp_thread) {
  if (!std::filesystem::exists("/proc/net/arp")) return;
  app::EventChannel ch;
  util::ManualClock clock;
  app::Scheduler scheduler{clock};
  platform::ArpNeighborDiscovery arp{clock, 5ms};
  app::DiscoveryService service{ch, arp, scheduler, clock};
  std::atomic<bool> stopped{false};
  auto id = ch.subscribe([&](const model::NetworkEvent& ev) {
    if (std::holds_alternative<model::events::DevicesDiscovered>(ev) && !stopped.load()) {
      service.stop();
      stopped = true;
    }
  });
  ASSERT_TRUE(service.start());
  for (int i = 0; i < 300 && !stopped.load(); ++i) std::this_thread::sleep_for(10ms);
  ASSERT_TRUE(stopped.load());
  ASSERT_FALSE(service.running());
  ASSERT_TRUE(ch.unsubscribe(id));
}
