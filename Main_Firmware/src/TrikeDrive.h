#pragma once
#include <stdint.h>
#include "Angle.h"
#include "HeadingPID.h"

// Three-wheel drive: front, left, right. Commands are signed percent [-100, 100].

enum class Wheel : uint8_t { Front = 0, Left, Right };

enum class DriveError : uint8_t {
  None = 0,
  InvalidParameter,
  WheelsNotConfigured
};

const char* driveErrorName(DriveError e);

// Actuator seam. The firmware implements it with servos, tests with a recorder.
// setDuty() returns false if the wheel output is not configured.
class WheelActuator {
public:
  virtual ~WheelActuator() {}
  virtual bool setDuty(Wheel wheel, int8_t signedPercent) = 0;
};

enum class DirectionKind : uint8_t {
  Forward = 0,
  Backward,
  Left,
  Right,
  VeerLeft,
  VeerRight
};

enum class Side : uint8_t { Left, Right };

struct Direction {
  DirectionKind kind = DirectionKind::Forward;
  int16_t percentage = 0;  // Veer* only, valid range [0, 100]

  static Direction forward()  { return Direction(DirectionKind::Forward); }
  static Direction backward() { return Direction(DirectionKind::Backward); }
  static Direction left()     { return Direction(DirectionKind::Left); }
  static Direction right()    { return Direction(DirectionKind::Right); }
  static Direction veerLeft(int16_t pct)  { return Direction(DirectionKind::VeerLeft, pct); }
  static Direction veerRight(int16_t pct) { return Direction(DirectionKind::VeerRight, pct); }

  Direction() = default;
  explicit Direction(DirectionKind k, int16_t pct = 0) : kind(k), percentage(pct) {}
};

struct WheelCommand {
  int8_t front = 0;
  int8_t left  = 0;
  int8_t right = 0;

  bool operator==(const WheelCommand& o) const {
    return front == o.front && left == o.left && right == o.right;
  }
  bool operator!=(const WheelCommand& o) const { return !(*this == o); }
};

// Direction + speed -> wheel triple. Pure.
//   Forward (s, s, s)      Backward (-s, -s, -s)
//   Left    (0, -s, s)     Right    (0, s, -s)
//   VeerLeft{p}  (s, s*(100-p)/100, s)
//   VeerRight{p} (s, s, s*(100-p)/100)
DriveError motorDirection(const Direction& dir, uint8_t speed, WheelCommand* out);

enum class CorrectionPolicy : uint8_t {
  Proportional = 0,
  BangBang
};

class TrikeDrive {
public:
  struct Config {
    CorrectionPolicy policy = CorrectionPolicy::Proportional;

    // Proportional policy (error in degrees)
    float kp = 1.5f;
    float ki = 0.0f;
    float kd = 0.0f;
    float dTau = 0.0f;
    float pidOutputAbs = 25.0f;
    float pidIntegralAbs = 50.0f;
    float straightBand = 0.5f;     // |u| below this -> no veer
    float veerBaseOffset = 70.0f;  // veer% = offset + |u|
    uint16_t ctrlDtMs = 20;

    // Bang-bang policy
    float deadbandDeg = 1.0f;
    float thresholdDeg = 2.0f;
    int16_t bangVeerPct = 80;
  };

  TrikeDrive() = default;

  void begin(WheelActuator* wheels) { begin(wheels, Config()); }
  void begin(WheelActuator* wheels, const Config& cfg);

  DriveError drive(const Direction& dir, uint8_t speed);
  DriveError stop();

  // Hold desired heading while moving Forward/Backward. Policy picked by Config.
  DriveError driveStraight(Angle<Radians> current, Angle<Radians> desired,
                           const Direction& base, uint8_t speed);

  // Rescale the side wheels relative to whichever is currently faster.
  DriveError veer(Side side, int16_t percentage);

  // New heading reference: clear PID history and the bang-bang hold state.
  void resetCorrection();

  const WheelCommand& command() const { return cmd_; }
  const Config& config() const { return cfg_; }
  bool configured() const { return wheels_ != nullptr; }

  // What the last driveStraight() call decided (for telemetry).
  float lastCorrection() const { return lastU_; }

private:
  DriveError apply_(const WheelCommand& c);
  DriveError straightProportional_(float errDeg, const Direction& base, uint8_t speed);
  DriveError straightBangBang_(float errDeg, const Direction& base, uint8_t speed);
  DriveError veerToward_(bool reduceYaw, const Direction& base, int16_t pct, uint8_t speed);

  WheelActuator* wheels_ = nullptr;
  Config cfg_;
  HeadingPID pid_;
  WheelCommand cmd_;

  // bang-bang hold: only valid while the last command came from driveStraight()
  bool straightActive_ = false;
  DirectionKind straightBase_ = DirectionKind::Forward;
  uint8_t straightSpeed_ = 0;

  float lastU_ = 0.0f;
};
