#include "PreciseTurn.h"

namespace {

struct TurnLeg {
  Side  side;
  float targetDeg;
};

const TurnLeg LEGS[PreciseTurn::LEG_COUNT] = {
  { Side::Left,   -90.0f },
  { Side::Left,  -179.0f },
  { Side::Right,  -90.0f },
  { Side::Right,   -1.0f },
};

}  // namespace

PreciseTurn::PreciseTurn(TrikeDrive& drive, PhaseSlot& slot, const Config& cfg)
: drive_(drive), slot_(slot), cfg_(cfg) {}

bool PreciseTurn::reached_(float relDeg) const {
  const TurnLeg& l = LEGS[leg_];
  if (l.side == Side::Right) return fabsf(relDeg) <= fabsf(l.targetDeg);

  // overshooting -180 wraps to the positive side
  if (l.targetDeg < -90.0f && relDeg > 90.0f) return true;
  return relDeg <= l.targetDeg;
}

PreciseTurn::TickReport PreciseTurn::tick(Angle<Radians> yaw, uint32_t nowMs) {
  TickReport r;

  const MissionPhase shared = slot_.current();
  if (shared == MissionPhase::WaitForStart) {
    running_ = false;
    r.driveError = drive_.stop();
    return r;
  }

  if (!running_) {
    refYaw_ = normalized(yaw);
    leg_ = 0;
    holding_ = false;
    holdTimer_.cancel();
    drive_.resetCorrection();
    running_ = true;
  }
  r.running = true;

  if (holding_) {
    r.driveError = drive_.stop();
    if (r.driveError != DriveError::None) return r;
    if (!holdTimer_.confirm(nowMs, cfg_.holdMs)) return r;

    holding_ = false;
    if (++leg_ < LEG_COUNT) return r;

    // A press that landed meanwhile wins and restarts the drill next tick.
    running_ = false;
    leg_ = 0;
    r.running = false;
    r.finished = slot_.advance(shared, MissionPhase::WaitForStart);
    return r;
  }

  const float relDeg = toDegrees(angleDiff(yaw, refYaw_)).value();
  if (reached_(relDeg)) {
    r.driveError = drive_.stop();
    if (r.driveError != DriveError::None) return r;
    holding_ = true;
    holdTimer_.confirm(nowMs, cfg_.holdMs);  // arms
    r.legReached = true;
    return r;
  }

  const Side side = LEGS[leg_].side;
  r.driveError = drive_.drive(side == Side::Left ? Direction::left() : Direction::right(), cfg_.speed);
  return r;
}
