#include "MissionFsm.h"

MissionFsm::MissionFsm(TrikeDrive& drive, const CourseGeometry& geometry, PhaseSlot& slot,
                       const MissionConfig& cfg)
: drive_(drive), geo_(geometry), slot_(slot), cfg_(cfg) {
  enter_(slot_.current());
}

// ============================================================
// Phase bookkeeping
// ============================================================

void MissionFsm::enter_(MissionPhase p) {
  active_ = p;

  climbTimer_.cancel();
  rangeTimer_.cancel();
  pitchTimer_.cancel();
  rollTimer_.cancel();

  drive_.resetCorrection();

  switch (p) {
    case MissionPhase::ApproachObstacle:
      // new run: re-capture course forward on the first tick
      refValid_ = false;
      targetValid_ = false;
      break;
    case MissionPhase::ScanForTarget:
      scanLeft_ = true;
      targetValid_ = false;
      break;
    default:
      break;
  }
}

bool MissionFsm::commit_(MissionPhase next, TickReport& r) {
  // A request() that landed during this tick wins; it is picked up next tick.
  if (!slot_.advance(active_, next)) return false;
  enter_(next);
  r.transitioned = true;
  return true;
}

bool MissionFsm::confirmWindow_(DebounceTimer& t, uint32_t nowMs, uint16_t windowMs) {
  if (windowMs == 0) {
    t.cancel();
    return true;
  }
  return t.confirm(nowMs, windowMs);
}

bool MissionFsm::debounced_(DebounceTimer& t, bool guard, uint32_t nowMs, uint16_t windowMs) {
  if (!guard) {
    t.cancel();
    return false;
  }
  return confirmWindow_(t, nowMs, windowMs);
}

void MissionFsm::ensureReference_(const SensorSnapshot& s) {
  if (refValid_) return;
  refYaw_ = normalized(s.yaw);
  refValid_ = true;
}

void MissionFsm::captureTarget_(const SensorSnapshot& s) {
  targetYaw_   = normalized(s.yaw);
  targetPitch_ = normalized(s.pitch);
  targetRoll_  = normalized(s.roll);
  targetValid_ = true;
}

// ============================================================
// Tick
// ============================================================

MissionFsm::TickReport MissionFsm::tick(const SensorSnapshot& s, uint32_t nowMs) {
  TickReport r;

  const MissionPhase shared = slot_.current();
  if (shared != active_) {
    r.forced = true;
    enter_(shared);
  }
  r.previous = active_;

  switch (active_) {
    case MissionPhase::WaitForStart:
      r.driveError = drive_.stop();
      break;

    case MissionPhase::ScanForTarget:
      scanTick_(s, r);
      break;

    case MissionPhase::ApproachTarget:
      approachTick_(s, nowMs, r);
      break;

    default: {
      const ClimbStep* step = cfg_.stepFor(active_);
      if (step) {
        climbTick_(*step, s, nowMs, r);
      } else {
        r.driveError = drive_.stop();
      }
    } break;
  }

  r.phase = active_;
  return r;
}

// ----- ApproachObstacle / ClimbUp / ClimbOver / ClimbDown -----
void MissionFsm::climbTick_(const ClimbStep& step, const SensorSnapshot& s, uint32_t nowMs,
                            TickReport& r) {
  if (step.holdHeading) {
    ensureReference_(s);
    r.driveError = drive_.driveStraight(s.yaw, refYaw_, Direction::forward(), step.speed);
  } else {
    r.driveError = drive_.drive(Direction::forward(), step.speed);
  }
  if (r.driveError != DriveError::None) return;

  const float pitchDeg = toDegrees(normalized(s.pitch)).value();
  const bool guard = (step.guard == PitchGuard::AtLeast) ? (pitchDeg >= step.pitchDeg)
                                                         : (pitchDeg <= step.pitchDeg);

  if (debounced_(climbTimer_, guard, nowMs, step.debounceMs)) {
    commit_(step.next, r);
  }
}

// ----- ScanForTarget -----
bool MissionFsm::rangeAnomaly_(Angle<Radians> relHeading, int32_t rangeMm) const {
  if (!geo_.valid() || rangeMm <= 0) return false;

  const float expected = geo_.expectedRangeMm(relHeading);
  // also rejects NaN / inf
  if (!(expected > 0.0f && expected < 1.0e7f)) return false;

  const int32_t expectedMm = (int32_t)expected;
  return (expectedMm - rangeMm) > cfg_.anomalyBufferMm;
}

void MissionFsm::scanTick_(const SensorSnapshot& s, TickReport& r) {
  ensureReference_(s);

  const Angle<Radians> rel = angleDiff(s.yaw, refYaw_);
  const float relDeg = toDegrees(rel).value();

  // left turn -> yaw decreases
  if (scanLeft_ && relDeg <= -cfg_.maxScanDeg) {
    scanLeft_ = false;
  } else if (!scanLeft_ && relDeg >= cfg_.maxScanDeg) {
    scanLeft_ = true;
  }

  r.driveError = drive_.drive(scanLeft_ ? Direction::left() : Direction::right(), cfg_.scanSpeed);
  if (r.driveError != DriveError::None) return;

  if (rangeAnomaly_(rel, s.rangeMm)) {
    captureTarget_(s);
    commit_(MissionPhase::ApproachTarget, r);
  }
}

// ----- ApproachTarget -----
void MissionFsm::approachTick_(const SensorSnapshot& s, uint32_t nowMs, TickReport& r) {
  if (!targetValid_) captureTarget_(s);

  r.driveError = drive_.driveStraight(s.yaw, targetYaw_, Direction::forward(), cfg_.approachSpeed);
  if (r.driveError != DriveError::None) return;

  // Every guard is evaluated each tick so each timer tracks its own condition.
  const bool rangeHit = (s.rangeMm > 0 && s.rangeMm < cfg_.contactRangeMm);
  const bool rangeContact = debounced_(rangeTimer_, rangeHit, nowMs, cfg_.contactDebounceMs);

  const float pitchDev = fabsf(toDegrees(angleDiff(s.pitch, targetPitch_)).value());
  const bool pitchContact = debounced_(pitchTimer_, pitchDev > cfg_.pitchMarginDeg,
                                       nowMs, cfg_.pitchDebounceMs);

  bool rollContact = false;
  if (cfg_.contactGuards == ContactGuards::PitchAndRoll) {
    const float rollDev = fabsf(toDegrees(angleDiff(s.roll, targetRoll_)).value());
    rollContact = debounced_(rollTimer_, rollDev > cfg_.rollMarginDeg, nowMs, cfg_.rollDebounceMs);
  } else {
    rollTimer_.cancel();
  }

  if (!rangeContact && !pitchContact && !rollContact) return;

  r.driveError = drive_.stop();
  if (r.driveError != DriveError::None) return;

  if (commit_(MissionPhase::WaitForStart, r)) {
    refValid_ = false;
    targetValid_ = false;
  }
}
