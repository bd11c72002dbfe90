#include <unity.h>

#include <vector>

#include "core/scheduler.h"
#include "fake_clock.h"
#include "log_capture.h"

void test_overrun_runs_next_action_immediately() {
  FakeClock clock;
  Scheduler scheduler(clock, 2000);
  std::vector<uint32_t> starts;

  scheduler.run([&] {
    starts.push_back(clock.now_ms());
    if (starts.size() == 1) clock.advance(3000);
    if (starts.size() == 2) scheduler.request_stop();
  });

  TEST_ASSERT_EQUAL_UINT32(2, starts.size());
  TEST_ASSERT_EQUAL_UINT32(0, starts[0]);
  TEST_ASSERT_EQUAL_UINT32(3000, starts[1]);
  TEST_ASSERT_EQUAL_UINT32(1, scheduler.overruns());
  TEST_ASSERT_EQUAL_UINT32(0, clock.sleeps.size());
  TEST_ASSERT_TRUE(log_capture::contains(LogLevel::WARN, "overrun"));
}

void test_start_times_stay_on_the_grid() {
  FakeClock clock;
  Scheduler scheduler(clock, 2000);
  std::vector<uint32_t> starts;

  scheduler.run([&] {
    starts.push_back(clock.now_ms());
    clock.advance(100);
    if (starts.size() == 4) scheduler.request_stop();
  });

  TEST_ASSERT_EQUAL_UINT32(4, starts.size());
  TEST_ASSERT_EQUAL_UINT32(0, starts[0]);
  TEST_ASSERT_EQUAL_UINT32(2000, starts[1]);
  TEST_ASSERT_EQUAL_UINT32(4000, starts[2]);
  TEST_ASSERT_EQUAL_UINT32(6000, starts[3]);
  TEST_ASSERT_EQUAL_UINT32(1900, clock.sleeps[0]);
  TEST_ASSERT_EQUAL_UINT32(0, scheduler.overruns());
  TEST_ASSERT_EQUAL_UINT32(4, scheduler.ticks());
}

void test_grid_resumes_after_overrun() {
  FakeClock clock;
  Scheduler scheduler(clock, 1000);
  std::vector<uint32_t> starts;

  scheduler.run([&] {
    starts.push_back(clock.now_ms());
    clock.advance(starts.size() == 2 ? 1500 : 10);
    if (starts.size() == 4) scheduler.request_stop();
  });

  // The second action ends at 2500; the third starts there and the grid follows it.
  TEST_ASSERT_EQUAL_UINT32(0, starts[0]);
  TEST_ASSERT_EQUAL_UINT32(1000, starts[1]);
  TEST_ASSERT_EQUAL_UINT32(2500, starts[2]);
  TEST_ASSERT_EQUAL_UINT32(3500, starts[3]);
  TEST_ASSERT_EQUAL_UINT32(1, scheduler.overruns());
}

void test_grid_survives_clock_wrap() {
  FakeClock clock(0xFFFFFC18u); // 1000 ms before wrap
  Scheduler scheduler(clock, 600);
  std::vector<uint32_t> starts;

  scheduler.run([&] {
    starts.push_back(clock.now_ms());
    if (starts.size() == 3) scheduler.request_stop();
  });

  TEST_ASSERT_EQUAL_UINT32(0xFFFFFC18u, starts[0]);
  TEST_ASSERT_EQUAL_UINT32(0xFFFFFE70u, starts[1]);
  TEST_ASSERT_EQUAL_UINT32(200u, starts[2]);
  TEST_ASSERT_EQUAL_UINT32(0, scheduler.overruns());
}

void test_stop_before_run_skips_action() {
  FakeClock clock;
  Scheduler scheduler(clock, 1000);
  int runs = 0;

  scheduler.request_stop();
  scheduler.run([&] { runs++; });

  TEST_ASSERT_EQUAL_INT(0, runs);
  TEST_ASSERT_TRUE(scheduler.stop_requested());
}
