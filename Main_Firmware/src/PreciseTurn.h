#pragma once
#include <stdint.h>

#include "Angle.h"
#include "DebounceTimer.h"
#include "PhaseSlot.h"
#include "TrikeDrive.h"

// Bench drill for yaw tracking: four slow pivots with a timed hold after each.
//
//   leg 0  pivot Left  until rel <= -90    hold
//   leg 1  pivot Left  until rel <= -179   hold
//   leg 2  pivot Right until |rel| <= 90   hold
//   leg 3  pivot Right until |rel| <= 1    hold, then back to WaitForStart
//
// rel is yaw relative to the heading captured when the run starts (left turn -> yaw decreases).
// Shares the button PhaseSlot like DistanceDrill: WaitForStart = idle.
class PreciseTurn {
public:
  static const uint8_t LEG_COUNT = 4;

  struct Config {
    uint8_t  speed  = 5;
    uint16_t holdMs = 2000;
  };

  struct TickReport {
    bool running = false;
    bool legReached = false;  // stopped at this leg's target, hold started
    bool finished = false;    // last hold elapsed, slot returned to WaitForStart
    DriveError driveError = DriveError::None;
  };

  PreciseTurn(TrikeDrive& drive, PhaseSlot& slot) : PreciseTurn(drive, slot, Config()) {}
  PreciseTurn(TrikeDrive& drive, PhaseSlot& slot, const Config& cfg);

  TickReport tick(Angle<Radians> yaw, uint32_t nowMs);

  uint8_t leg() const { return leg_; }
  bool holding() const { return holding_; }

private:
  bool reached_(float relDeg) const;

  TrikeDrive& drive_;
  PhaseSlot& slot_;
  Config cfg_;

  bool running_ = false;
  bool holding_ = false;
  uint8_t leg_ = 0;
  Angle<Radians> refYaw_;
  DebounceTimer holdTimer_;
};
