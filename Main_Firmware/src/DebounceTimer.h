#pragma once
#include <stdint.h>

// Sustained-condition filter.
//   idle  --confirm()-->  armed (returns false)
//   armed --confirm(), elapsed >= window--> idle (returns true)
//   armed --cancel()-->   idle
//
// Time is whatever monotonic ms counter the caller passes in (millis() on target).
// Elapsed time uses unsigned wrap-safe subtraction.
struct DebounceTimer {
  bool     armed   = false;
  uint32_t startMs = 0;

  bool confirm(uint32_t nowMs, uint32_t windowMs) {
    if (!armed) {
      armed = true;
      startMs = nowMs;
      return false;
    }
    if ((uint32_t)(nowMs - startMs) >= windowMs) {
      armed = false;
      return true;
    }
    return false;
  }

  // Guard went false before confirmation: drop the pending event.
  void cancel() { armed = false; }

  uint32_t elapsed(uint32_t nowMs) const {
    return armed ? (uint32_t)(nowMs - startMs) : 0;
  }
};
