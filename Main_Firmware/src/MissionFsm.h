#pragma once
#include <stdint.h>

#include "Angle.h"
#include "CourseGeometry.h"
#include "DebounceTimer.h"
#include "MissionConfig.h"
#include "PhaseSlot.h"
#include "TrikeDrive.h"

// One reading per control tick. Orientation already mounting-corrected and zeroed.
struct SensorSnapshot {
  Angle<Radians> yaw;
  Angle<Radians> pitch;
  Angle<Radians> roll;
  int32_t rangeMm = 0;   // <= 0 means no usable reading
};

// Course sequencer. Call tick() once per control loop iteration; it never blocks.
//
// The active phase lives in the PhaseSlot so the button interrupt can force it.
// Everything else here (timers, scan direction, reference headings) belongs to
// the control loop only.
class MissionFsm {
public:
  struct TickReport {
    MissionPhase previous = MissionPhase::WaitForStart;  // phase this tick ran
    MissionPhase phase    = MissionPhase::WaitForStart;  // phase after the tick
    bool forced       = false;   // a request() changed the phase since the last tick
    bool transitioned = false;   // a guard confirmed and the phase advanced
    DriveError driveError = DriveError::None;
  };

  MissionFsm(TrikeDrive& drive, const CourseGeometry& geometry, PhaseSlot& slot,
             const MissionConfig& cfg = MissionConfig());

  TickReport tick(const SensorSnapshot& s, uint32_t nowMs);

  MissionPhase phase() const { return active_; }
  const MissionConfig& config() const { return cfg_; }

  bool hasReference() const { return refValid_; }
  Angle<Radians> referenceYaw() const { return refYaw_; }

  bool hasTarget() const { return targetValid_; }
  Angle<Radians> targetYaw() const { return targetYaw_; }

  bool scanningLeft() const { return scanLeft_; }

private:
  void enter_(MissionPhase p);
  bool commit_(MissionPhase next, TickReport& r);

  void climbTick_(const ClimbStep& step, const SensorSnapshot& s, uint32_t nowMs, TickReport& r);
  void scanTick_(const SensorSnapshot& s, TickReport& r);
  void approachTick_(const SensorSnapshot& s, uint32_t nowMs, TickReport& r);

  void ensureReference_(const SensorSnapshot& s);
  void captureTarget_(const SensorSnapshot& s);
  bool rangeAnomaly_(Angle<Radians> relHeading, int32_t rangeMm) const;

  // window 0 -> no debounce
  static bool confirmWindow_(DebounceTimer& t, uint32_t nowMs, uint16_t windowMs);
  // guard true -> confirm, guard false -> cancel
  static bool debounced_(DebounceTimer& t, bool guard, uint32_t nowMs, uint16_t windowMs);

  TrikeDrive& drive_;
  const CourseGeometry& geo_;
  PhaseSlot& slot_;
  MissionConfig cfg_;

  MissionPhase active_ = MissionPhase::WaitForStart;

  // course-forward reference, captured when a run starts
  bool refValid_ = false;
  Angle<Radians> refYaw_;

  // climb phases
  DebounceTimer climbTimer_;

  // scan
  bool scanLeft_ = true;

  // target reference (zero for the contact heuristic)
  bool targetValid_ = false;
  Angle<Radians> targetYaw_;
  Angle<Radians> targetPitch_;
  Angle<Radians> targetRoll_;

  DebounceTimer rangeTimer_;
  DebounceTimer pitchTimer_;
  DebounceTimer rollTimer_;
};
