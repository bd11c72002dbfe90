#pragma once
#include <stdint.h>

#include <atomic>
#include <functional>

class IClock {
public:
  virtual ~IClock() = default;

  // Monotonic milliseconds; wraps like millis().
  virtual uint32_t now_ms() = 0;

  // May return early (signal delivery). Callers re-check their deadline.
  virtual void sleep_ms(uint32_t ms) = 0;
};

class SystemClock : public IClock {
public:
  uint32_t now_ms() override;
  void sleep_ms(uint32_t ms) override;
};

// Runs an action every interval_ms, anchored to the start time so action
// latency does not accumulate. An action that outlasts the interval is logged
// as an overrun and the anchor is reset to "now" instead of bursting to catch up.
class Scheduler {
public:
  using Action = std::function<void()>;

  Scheduler(IClock& clock, uint32_t interval_ms);

  // Returns only after request_stop().
  void run(const Action& action);

  // Safe to call from a signal handler or from inside the action.
  void request_stop() { stop_.store(true); }
  bool stop_requested() const { return stop_.load(); }

  uint32_t interval_ms() const { return interval_ms_; }
  uint32_t ticks() const { return ticks_; }
  uint32_t overruns() const { return overruns_; }

private:
  void sleep_until(uint32_t deadline_ms);

  IClock& clock_;
  uint32_t interval_ms_;
  std::atomic<bool> stop_ {false};
  uint32_t ticks_ {0};
  uint32_t overruns_ {0};
};
