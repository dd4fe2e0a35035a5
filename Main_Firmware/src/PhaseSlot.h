#pragma once
#include "MissionConfig.h"

// The only value shared between the control loop and the button interrupt.
//
//   request()  interrupt side: unconditional write of a complete phase
//   current()  loop side: atomic read
//   advance()  loop side: write only if nobody changed the phase since the loop read it,
//              so a request landing mid-tick is not overwritten
class PhaseSlot {
public:
  virtual ~PhaseSlot() {}
  virtual void request(MissionPhase p) = 0;
  virtual MissionPhase current() const = 0;
  virtual bool advance(MissionPhase from, MissionPhase to) = 0;
};

// Guard: any default-constructible RAII type that holds the lock for its lifetime.
// Target uses an SREG save + cli() guard, host tests use a mutex.
template <class Guard>
class LockedPhaseSlot : public PhaseSlot {
public:
  explicit LockedPhaseSlot(MissionPhase initial = MissionPhase::WaitForStart)
  : phase_(initial) {}

  void request(MissionPhase p) override {
    Guard g;
    phase_ = p;
  }

  MissionPhase current() const override {
    Guard g;
    return phase_;
  }

  bool advance(MissionPhase from, MissionPhase to) override {
    Guard g;
    if (phase_ != from) return false;
    phase_ = to;
    return true;
  }

private:
  volatile MissionPhase phase_;
};
