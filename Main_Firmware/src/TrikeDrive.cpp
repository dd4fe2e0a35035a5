#include <stdlib.h>
#include "TrikeDrive.h"

const char* driveErrorName(DriveError e) {
  switch (e) {
    case DriveError::None:                return "none";
    case DriveError::InvalidParameter:    return "invalid parameter";
    case DriveError::WheelsNotConfigured: return "wheels not configured";
  }
  return "?";
}

static inline bool pctValid(int16_t p) { return p >= 0 && p <= 100; }

static inline int16_t scaled(int16_t v, int16_t pct) {
  // v * (100 - pct) / 100, truncating toward zero
  return (int16_t)((int32_t)v * (int32_t)(100 - pct) / 100);
}

DriveError motorDirection(const Direction& dir, uint8_t speed, WheelCommand* out) {
  if (speed > 100) return DriveError::InvalidParameter;
  const int16_t s = (int16_t)speed;

  WheelCommand c;
  switch (dir.kind) {
    case DirectionKind::Forward:
      c.front = (int8_t)s;  c.left = (int8_t)s;  c.right = (int8_t)s;
      break;
    case DirectionKind::Backward:
      c.front = (int8_t)-s; c.left = (int8_t)-s; c.right = (int8_t)-s;
      break;
    case DirectionKind::Left:
      c.front = 0; c.left = (int8_t)-s; c.right = (int8_t)s;
      break;
    case DirectionKind::Right:
      c.front = 0; c.left = (int8_t)s;  c.right = (int8_t)-s;
      break;
    case DirectionKind::VeerLeft:
      if (!pctValid(dir.percentage)) return DriveError::InvalidParameter;
      c.front = (int8_t)s; c.left = (int8_t)scaled(s, dir.percentage); c.right = (int8_t)s;
      break;
    case DirectionKind::VeerRight:
      if (!pctValid(dir.percentage)) return DriveError::InvalidParameter;
      c.front = (int8_t)s; c.left = (int8_t)s; c.right = (int8_t)scaled(s, dir.percentage);
      break;
    default:
      return DriveError::InvalidParameter;
  }

  if (out) *out = c;
  return DriveError::None;
}

// ------------------------------------------------------------

void TrikeDrive::begin(WheelActuator* wheels, const Config& cfg) {
  wheels_ = wheels;
  cfg_ = cfg;

  pid_.setGains(cfg_.kp, cfg_.ki, cfg_.kd);
  pid_.setDt((cfg_.ctrlDtMs > 0 ? cfg_.ctrlDtMs : 1) / 1000.0f);
  pid_.setOutputLimit(cfg_.pidOutputAbs);
  pid_.setIntegralLimit(cfg_.pidIntegralAbs);
  pid_.setDerivativeFilterTau(cfg_.dTau);

  resetCorrection();
  cmd_ = WheelCommand();
}

void TrikeDrive::resetCorrection() {
  pid_.reset();
  straightActive_ = false;
  lastU_ = 0.0f;
}

DriveError TrikeDrive::apply_(const WheelCommand& c) {
  if (!wheels_) return DriveError::WheelsNotConfigured;

  const bool ok = wheels_->setDuty(Wheel::Front, c.front) &&
                  wheels_->setDuty(Wheel::Left,  c.left) &&
                  wheels_->setDuty(Wheel::Right, c.right);
  if (!ok) return DriveError::WheelsNotConfigured;

  cmd_ = c;
  return DriveError::None;
}

DriveError TrikeDrive::drive(const Direction& dir, uint8_t speed) {
  WheelCommand c;
  const DriveError e = motorDirection(dir, speed, &c);
  if (e != DriveError::None) return e;

  straightActive_ = false;
  return apply_(c);
}

DriveError TrikeDrive::stop() {
  return drive(Direction::forward(), 0);
}

DriveError TrikeDrive::veer(Side side, int16_t percentage) {
  if (!pctValid(percentage)) return DriveError::InvalidParameter;
  if (!wheels_) return DriveError::WheelsNotConfigured;

  const int16_t l = cmd_.left;
  const int16_t r = cmd_.right;
  const int16_t faster = (abs(l) >= abs(r)) ? l : r;
  const int16_t slower = scaled(faster, percentage);

  WheelCommand c = cmd_;
  if (side == Side::Left) {
    c.left = (int8_t)slower;  c.right = (int8_t)faster;
  } else {
    c.left = (int8_t)faster;  c.right = (int8_t)slower;
  }

  straightActive_ = false;
  return apply_(c);
}

// ------------------------------------------------------------
// Heading hold
// ------------------------------------------------------------
// err = wrap(current - desired) > 0 means yaw must decrease (turn CCW).
//   Forward:  slowing the left side turns CCW  -> VeerLeft
//   Backward: slowing the right side turns CCW -> VeerRight

DriveError TrikeDrive::driveStraight(Angle<Radians> current, Angle<Radians> desired,
                                     const Direction& base, uint8_t speed) {
  if (base.kind != DirectionKind::Forward && base.kind != DirectionKind::Backward) {
    return DriveError::InvalidParameter;
  }
  if (speed > 100) return DriveError::InvalidParameter;
  if (!wheels_) return DriveError::WheelsNotConfigured;

  const float errDeg = toDegrees(angleDiff(current, desired)).value();

  DriveError e;
  if (cfg_.policy == CorrectionPolicy::BangBang) {
    e = straightBangBang_(errDeg, base, speed);
  } else {
    e = straightProportional_(errDeg, base, speed);
  }

  if (e == DriveError::None) {
    straightActive_ = true;
    straightBase_ = base.kind;
    straightSpeed_ = speed;
  }
  return e;
}

DriveError TrikeDrive::veerToward_(bool reduceYaw, const Direction& base, int16_t pct, uint8_t speed) {
  const bool forward = (base.kind == DirectionKind::Forward);
  const bool slowLeft = (forward == reduceYaw);

  WheelCommand c;
  const DriveError e = motorDirection(slowLeft ? Direction::veerLeft(pct) : Direction::veerRight(pct),
                                      speed, &c);
  if (e != DriveError::None) return e;

  if (!forward) {
    c.front = (int8_t)-c.front;
    c.left  = (int8_t)-c.left;
    c.right = (int8_t)-c.right;
  }
  return apply_(c);
}

DriveError TrikeDrive::straightProportional_(float errDeg, const Direction& base, uint8_t speed) {
  const float u = pid_.update(errDeg);
  lastU_ = u;

  if (fabsf(u) < cfg_.straightBand) {
    WheelCommand c;
    const DriveError e = motorDirection(base, speed, &c);
    if (e != DriveError::None) return e;
    return apply_(c);
  }

  float pct = cfg_.veerBaseOffset + fabsf(u);
  if (pct < 0.0f) pct = 0.0f;
  if (pct > 100.0f) pct = 100.0f;

  return veerToward_(u > 0.0f, base, (int16_t)(pct + 0.5f), speed);
}

DriveError TrikeDrive::straightBangBang_(float errDeg, const Direction& base, uint8_t speed) {
  const float mag = fabsf(errDeg);
  lastU_ = errDeg;

  if (mag >= cfg_.thresholdDeg) {
    return veerToward_(errDeg > 0.0f, base, cfg_.bangVeerPct, speed);
  }

  const bool inDeadband = (mag <= cfg_.deadbandDeg);
  const bool canHold = straightActive_ && straightBase_ == base.kind && straightSpeed_ == speed;

  // Hysteresis band: keep whatever is on the wheels.
  if (!inDeadband && canHold) return DriveError::None;

  WheelCommand c;
  const DriveError e = motorDirection(base, speed, &c);
  if (e != DriveError::None) return e;
  return apply_(c);
}
