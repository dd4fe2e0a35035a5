#include "DistanceDrill.h"

DistanceDrill::DistanceDrill(TrikeDrive& drive, PhaseSlot& slot, const Config& cfg)
: drive_(drive), slot_(slot), cfg_(cfg) {}

DistanceDrill::TickReport DistanceDrill::tick(Angle<Radians> yaw, int32_t rangeMm) {
  TickReport r;

  const MissionPhase shared = slot_.current();
  if (shared == MissionPhase::WaitForStart) {
    running_ = false;
    r.driveError = drive_.stop();
    return r;
  }

  if (!running_) {
    // heading held for the whole step is the one we started on
    refYaw_ = normalized(yaw);
    drive_.resetCorrection();
    running_ = true;
  }
  r.running = true;

  r.driveError = drive_.driveStraight(yaw, refYaw_, Direction::forward(), cfg_.speed);
  if (r.driveError != DriveError::None) return r;

  // 0 = no reading yet
  if (rangeMm <= 0 || rangeMm > targetMm()) return r;

  r.driveError = drive_.stop();
  if (r.driveError != DriveError::None) return r;

  if (slot_.advance(shared, MissionPhase::WaitForStart)) {
    running_ = false;
    r.running = false;
    r.stepDone = true;
    step_ = (uint8_t)((step_ + 1) % STEP_COUNT);
  }
  return r;
}
