#define LOG_TAG "sched"
#include "core/scheduler.h"

#include <time.h>

#include "core/log.h"

uint32_t SystemClock::now_ms() {
  struct timespec ts {};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint32_t>(static_cast<uint64_t>(ts.tv_sec) * 1000u + static_cast<uint64_t>(ts.tv_nsec) / 1000000u);
}

void SystemClock::sleep_ms(uint32_t ms) {
  struct timespec req {};
  req.tv_sec = static_cast<time_t>(ms / 1000);
  req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
  // EINTR is expected on SIGINT/SIGTERM; the scheduler re-checks its stop flag.
  nanosleep(&req, nullptr);
}

Scheduler::Scheduler(IClock& clock, uint32_t interval_ms) : clock_(clock), interval_ms_(interval_ms) {}

void Scheduler::sleep_until(uint32_t deadline_ms) {
  while (!stop_requested()) {
    const int32_t remaining = static_cast<int32_t>(deadline_ms - clock_.now_ms());
    if (remaining <= 0) return;
    clock_.sleep_ms(static_cast<uint32_t>(remaining));
  }
}

void Scheduler::run(const Action& action) {
  uint32_t next_run = clock_.now_ms();
  LOGI("running every %u ms", interval_ms_);

  while (!stop_requested()) {
    const uint32_t started = clock_.now_ms();
    action();
    ticks_++;
    if (stop_requested()) break;

    next_run += interval_ms_;
    const uint32_t now = clock_.now_ms();
    const int32_t sleep_for = static_cast<int32_t>(next_run - now);
    if (sleep_for < 0) {
      overruns_++;
      LOGW("overrun: action took %u ms, interval is %u ms", now - started, interval_ms_);
      next_run = now;
      continue;
    }
    sleep_until(next_run);
  }

  LOGI("stopped after %u ticks (%u overruns)", ticks_, overruns_);
}
