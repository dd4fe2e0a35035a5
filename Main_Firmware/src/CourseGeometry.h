#pragma once
#include <stdint.h>
#include "Angle.h"

// Expected unobstructed range reading as a function of scan heading.
//
// Frame: robot pivot point P on the course centreline, heading 0 = course
// forward (towards the rear boundary). The range sensor faces along the
// heading, sensorOffsetMm in front of P, so a reading is the P-to-boundary
// distance along the ray minus that offset.
//
//   |h| <= cornerAngle            rear boundary:  L      / cos(|h|)
//   cornerAngle < |h| <= rampAng  side boundary:  (W/2)  / cos(pi/2 - |h|)
//   |h| > rampAngle               ramp edge:      RL     / cos(pi - |h|)
//
// The ramp sits behind P and spans the lane, so its top edge is a line RL
// behind P. Both threshold angles are where neighbouring boundaries meet,
// which keeps the model continuous.
class CourseGeometry {
public:
  struct Config {
    float courseWidthMm   = 1220.0f;
    float courseLengthMm  = 1830.0f;
    float rampLengthMm    = 610.0f;
    float rampWidthMm     = 1220.0f;
    float sensorOffsetMm  = 95.0f;
  };

  CourseGeometry() : CourseGeometry(Config()) {}
  explicit CourseGeometry(const Config& cfg);

  // All dimensions positive, ramp no wider than the lane, sensor inside the course.
  bool valid() const { return valid_; }

  float expectedRangeMm(Angle<Radians> heading) const;

  Angle<Radians> cornerAngle() const { return Angle<Radians>((float)cornerRad_); }
  Angle<Radians> rampAngle() const { return Angle<Radians>((float)rampRad_); }

  const Config& config() const { return cfg_; }

private:
  Config cfg_;
  bool   valid_;

  // computed once
  double halfWidth_;
  double cornerRad_;
  double rampRad_;
};
