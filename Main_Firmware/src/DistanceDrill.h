#pragma once
#include <stdint.h>

#include "Angle.h"
#include "PhaseSlot.h"
#include "TrikeDrive.h"

// Bench drill: drive straight on heading until the range sensor reads the next
// step distance, stop, and wait for the button before the next step.
//
// Shares the button PhaseSlot with the mission: WaitForStart means idle, any
// other requested phase means "run the current step".
class DistanceDrill {
public:
  static const uint8_t STEP_COUNT = 4;

  struct Config {
    int32_t stepMm[STEP_COUNT] = {2000, 1500, 1000, 500};  // from the front of the robot
    int32_t sensorOffsetMm = 95;                            // sensor behind the front
    uint8_t speed = 100;
  };

  struct TickReport {
    bool running = false;
    bool stepDone = false;  // stopped at the target this tick
    DriveError driveError = DriveError::None;
  };

  DistanceDrill(TrikeDrive& drive, PhaseSlot& slot) : DistanceDrill(drive, slot, Config()) {}
  DistanceDrill(TrikeDrive& drive, PhaseSlot& slot, const Config& cfg);

  TickReport tick(Angle<Radians> yaw, int32_t rangeMm);

  uint8_t step() const { return step_; }
  int32_t targetMm() const { return cfg_.stepMm[step_] + cfg_.sensorOffsetMm; }

private:
  TrikeDrive& drive_;
  PhaseSlot& slot_;
  Config cfg_;

  uint8_t step_ = 0;
  bool running_ = false;
  Angle<Radians> refYaw_;
};
