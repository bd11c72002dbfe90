#pragma once
#include <stdint.h>

#include <vector>

#include "core/scheduler.h"

// Time only moves when something sleeps or the test calls advance().
class FakeClock : public IClock {
public:
  explicit FakeClock(uint32_t start_ms = 0) : now_(start_ms) {}

  uint32_t now_ms() override { return now_; }
  void sleep_ms(uint32_t ms) override {
    sleeps.push_back(ms);
    now_ += ms;
  }

  void advance(uint32_t ms) { now_ += ms; }

  std::vector<uint32_t> sleeps {};

private:
  uint32_t now_;
};
