#pragma once
#include <mutex>

#include "TrikeDrive.h"
#include "PhaseSlot.h"

// Records every setDuty() call and the current duty per wheel.
class FakeWheels : public WheelActuator {
public:
  bool setDuty(Wheel wheel, int8_t signedPercent) override {
    calls++;
    if (fail) return false;
    duty[(int)wheel] = signedPercent;
    return true;
  }

  WheelCommand current() const {
    WheelCommand c;
    c.front = duty[0];
    c.left  = duty[1];
    c.right = duty[2];
    return c;
  }

  bool fail = false;
  int calls = 0;
  int8_t duty[3] = {0, 0, 0};
};

// Host stand-in for the interrupt-disable guard.
struct MutexGuard {
  MutexGuard() { mutex().lock(); }
  ~MutexGuard() { mutex().unlock(); }
  MutexGuard(const MutexGuard&) = delete;
  MutexGuard& operator=(const MutexGuard&) = delete;

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

typedef LockedPhaseSlot<MutexGuard> TestPhaseSlot;

inline WheelCommand cmd(int f, int l, int r) {
  WheelCommand c;
  c.front = (int8_t)f;
  c.left  = (int8_t)l;
  c.right = (int8_t)r;
  return c;
}

inline Angle<Radians> deg(float d) { return toRadians(Angle<Degrees>(d)); }
