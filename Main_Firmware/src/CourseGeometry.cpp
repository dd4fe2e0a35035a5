#include "CourseGeometry.h"

CourseGeometry::CourseGeometry(const Config& cfg)
: cfg_(cfg) {
  valid_ = cfg_.courseWidthMm > 0.0f &&
           cfg_.courseLengthMm > 0.0f &&
           cfg_.rampLengthMm > 0.0f &&
           cfg_.rampWidthMm > 0.0f &&
           cfg_.rampWidthMm <= cfg_.courseWidthMm &&
           cfg_.sensorOffsetMm >= 0.0f &&
           cfg_.sensorOffsetMm < cfg_.courseLengthMm;

  halfWidth_ = 0.5 * (double)cfg_.courseWidthMm;
  cornerRad_ = atan(halfWidth_ / (double)cfg_.courseLengthMm);
  rampRad_   = M_PI - atan(halfWidth_ / (double)cfg_.rampLengthMm);
}

float CourseGeometry::expectedRangeMm(Angle<Radians> heading) const {
  const double a = fabs((double)normalized(heading).value());

  double adjacent;
  double effective;
  if (a <= cornerRad_) {
    adjacent  = (double)cfg_.courseLengthMm;
    effective = a;
  } else if (a <= rampRad_) {
    adjacent  = halfWidth_;
    effective = 0.5 * M_PI - a;
  } else {
    adjacent  = (double)cfg_.rampLengthMm;
    effective = M_PI - a;
  }

  return (float)(adjacent / cos(effective) - (double)cfg_.sensorOffsetMm);
}
