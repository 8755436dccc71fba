#include "minitest.hpp"
#include "app/EventChannel.hpp"
#include "model/Event.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lanlink;
using namespace std::chrono_literals;

TEST(events_delivered_in_subscription_order) {
  app::EventChannel ch;
  std::vector<std::string> seen;
  (void)ch.subscribe([&](const model::NetworkEvent&) { seen.push_back("a"); });
  (void)ch.subscribe([&](const model::NetworkEvent&) { seen.push_back("b"); });
  ch.publish(model::events::Initialized{});
  ch.flush();
  ASSERT_EQ(seen.size(), 2u);
  ASSERT_EQ(seen[0], "a");
  ASSERT_EQ(seen[1], "b");
}

TEST(events_no_history_for_late_subscribers) {
  app::EventChannel ch;
  ch.publish(model::events::Initialized{});
  ch.flush();
  int n = 0;
  auto id = ch.subscribe([&](const model::NetworkEvent&) { ++n; });
  ASSERT_EQ(n, 0);
  ch.publish(model::events::ConfigUpdated{});
  ch.flush();
  ASSERT_EQ(n, 1);
  ASSERT_EQ(ch.published_count(), 2u);
  (void)ch.unsubscribe(id);
}

TEST(events_unsubscribe_stops_delivery) {
  app::EventChannel ch;
  int n = 0;
  auto id = ch.subscribe([&](const model::NetworkEvent&) { ++n; });
  ASSERT_TRUE(ch.unsubscribe(id));
  ASSERT_FALSE(ch.unsubscribe(id));
  ch.publish(model::events::Disconnected{});
  ch.flush();
  ASSERT_EQ(n, 0);
  ASSERT_EQ(ch.subscriber_count(), 0u);
}

TEST(events_throwing_subscriber_does_not_block_others) {
  app::EventChannel ch;
  int n = 0;
  (void)ch.subscribe([](const model::NetworkEvent&) { throw std::runtime_error("boom"); });
  (void)ch.subscribe([&](const model::NetworkEvent&) { ++n; });
  ch.publish(model::events::DiscoveryStarted{});
  ch.flush();
  ASSERT_EQ(n, 1);
}

TEST(events_reentrant_publish_and_unsubscribe) {
  app::EventChannel ch;
  std::vector<std::string> names;
  int self_calls = 0;
  app::EventChannel::SubscriptionId self = 0;
  self = ch.subscribe([&](const model::NetworkEvent& ev) {
    ++self_calls;
    if (std::holds_alternative<model::events::Connecting>(ev)) {
      ch.publish(model::events::Connected{"lab"});
      ch.flush();  // no-op on the delivery thread
      (void)ch.unsubscribe(self);
    }
  });
  (void)ch.subscribe([&](const model::NetworkEvent& ev) { names.emplace_back(model::event_name(ev)); });
  ch.publish(model::events::Connecting{"lab"});
  ch.flush();
  ch.flush();
  ch.publish(model::events::Disconnected{});
  ch.flush();
  ASSERT_EQ(self_calls, 1);
  ASSERT_EQ(names.size(), 3u);
  ASSERT_EQ(names[0], "connecting");
  ASSERT_EQ(names[1], "connected");
  ASSERT_EQ(names[2], "disconnected");
}

TEST(events_total_order_across_publishers) {
  app::EventChannel ch;
  std::vector<size_t> a, b;
  (void)ch.subscribe([&](const model::NetworkEvent& ev) {
    if (auto* s = std::get_if<model::events::NetworksScanned>(&ev)) a.push_back(s->count);
  });
  (void)ch.subscribe([&](const model::NetworkEvent& ev) {
    if (auto* s = std::get_if<model::events::NetworksScanned>(&ev)) b.push_back(s->count);
  });
  {
    std::jthread t1([&] { for (size_t i = 0; i < 200; ++i) ch.publish(model::events::NetworksScanned{i}); });
    std::jthread t2([&] { for (size_t i = 1000; i < 1200; ++i) ch.publish(model::events::NetworksScanned{i}); });
  }
  ch.flush();
  ASSERT_EQ(a.size(), 400u);
  ASSERT_TRUE(a == b);
}

TEST(events_publish_does_not_wait_for_slow_handler) {
  app::EventChannel ch;
  std::mutex gate;
  std::unique_lock<std::mutex> hold(gate);
  std::atomic<int> n{0};
  (void)ch.subscribe([&](const model::NetworkEvent&) {
    std::lock_guard<std::mutex> lk(gate);
    ++n;
  });
  ch.publish(model::events::DiscoveryStarted{});
  ch.publish(model::events::DiscoveryStopped{});
  ASSERT_EQ(ch.published_count(), 2u);
  ASSERT_EQ(n.load(), 0);
  hold.unlock();
  ch.flush();
  ASSERT_EQ(n.load(), 2);
}

TEST(events_handler_can_join_a_publishing_thread) {
  app::EventChannel ch;
  std::atomic<int> batches{0};
  (void)ch.subscribe([&](const model::NetworkEvent& ev) {
    if (std::holds_alternative<model::events::DiscoveryStopped>(ev)) {
      std::jthread producer([&] { ch.publish(model::events::DevicesDiscovered{3}); });
      producer.join();
    } else if (std::holds_alternative<model::events::DevicesDiscovered>(ev)) {
      ++batches;
    }
  });
  ch.publish(model::events::DiscoveryStopped{});
  ch.flush();
  ch.flush();
  ASSERT_EQ(batches.load(), 1);
}

TEST(events_unsubscribe_waits_for_running_handler) {
  app::EventChannel ch;
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  auto id = ch.subscribe([&](const model::NetworkEvent&) {
    entered = true;
    std::this_thread::sleep_for(50ms);
    finished = true;
  });
  ch.publish(model::events::Initialized{});
  while (!entered.load()) std::this_thread::yield();
  ASSERT_TRUE(ch.unsubscribe(id));
  ASSERT_TRUE(finished.load());
}

TEST(events_destruction_drains_queue) {
  std::atomic<int> n{0};
  {
    app::EventChannel ch;
    (void)ch.subscribe([&](const model::NetworkEvent&) { ++n; });
    for (int i = 0; i < 10; ++i) ch.publish(model::events::ConfigUpdated{});
  }
  ASSERT_EQ(n.load(), 10);
}

TEST(events_names_and_descriptions) {
  model::NetworkEvent ev = model::events::SharingServerStarted{8080};
  ASSERT_EQ(std::string(model::event_name(ev)), "sharing_server_started");
  ASSERT_TRUE(model::describe(ev).find("8080") != std::string::npos);
  model::NetworkEvent err = model::events::Error{model::ErrorKind::ScanFailed, "radio off"};
  ASSERT_EQ(std::string(model::event_name(err)), "error");
  ASSERT_TRUE(model::describe(err).find("radio off") != std::string::npos);
}
