#include "minitest.hpp"
#include "app/Scheduler.hpp"
#include "util/Clock.hpp"
#include <stdexcept>

using namespace lanlink;
using namespace std::chrono_literals;

TEST(scheduler_one_shot_runs_once_when_due) {
  util::ManualClock clock;
  app::Scheduler s(clock);
  int n = 0;
  (void)s.schedule_after("once", 1000ms, [&] { ++n; });
  ASSERT_EQ(s.run_due(), 0u);
  clock.advance(999ms);
  ASSERT_EQ(s.run_due(), 0u);
  clock.advance(1ms);
  ASSERT_EQ(s.run_due(), 1u);
  clock.advance(5000ms);
  ASSERT_EQ(s.run_due(), 0u);
  ASSERT_EQ(n, 1);
  ASSERT_EQ(s.pending(), 0u);
}

TEST(scheduler_periodic_catches_up_once) {
  util::ManualClock clock;
  app::Scheduler s(clock);
  int n = 0;
  auto id = s.schedule_every("tick", 100ms, [&] { ++n; });
  clock.advance(1000ms);
  ASSERT_EQ(s.run_due(), 1u);
  ASSERT_EQ(n, 1);
  clock.advance(100ms);
  (void)s.run_due();
  ASSERT_EQ(n, 2);
  ASSERT_TRUE(s.scheduled(id));
}

TEST(scheduler_cancel) {
  util::ManualClock clock;
  app::Scheduler s(clock);
  int n = 0;
  auto id = s.schedule_every("tick", 10ms, [&] { ++n; });
  ASSERT_TRUE(s.cancel(id));
  ASSERT_FALSE(s.cancel(id));
  clock.advance(100ms);
  (void)s.run_due();
  ASSERT_EQ(n, 0);
}

TEST(scheduler_task_may_cancel_itself_and_schedule_more) {
  util::ManualClock clock;
  app::Scheduler s(clock);
  app::Scheduler::TaskId id = 0;
  int follow = 0;
  id = s.schedule_every("self", 10ms, [&] {
    (void)s.cancel(id);
    (void)s.schedule_after("follow", 0ms, [&] { ++follow; });
  });
  clock.advance(10ms);
  (void)s.run_due();
  ASSERT_FALSE(s.scheduled(id));
  (void)s.run_due();
  ASSERT_EQ(follow, 1);
}

TEST(scheduler_throwing_task_is_contained) {
  util::ManualClock clock;
  app::Scheduler s(clock);
  int n = 0;
  (void)s.schedule_after("bad", 0ms, [] { throw std::runtime_error("nope"); });
  (void)s.schedule_after("good", 0ms, [&] { ++n; });
  ASSERT_EQ(s.run_due(), 2u);
  ASSERT_EQ(n, 1);
}

TEST(scheduler_thread_start_stop) {
  util::SystemClock clock;
  app::Scheduler s(clock, 5ms);
  s.start();
  s.start();
  s.stop();
  s.stop();
  ASSERT_EQ(s.pending(), 0u);
}
