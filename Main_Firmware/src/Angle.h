#pragma once
#include <math.h>

// Unit-tagged angle. Radians and Degrees never mix without an explicit
// toDegrees()/toRadians() conversion.
//
// Convention used across the firmware (after IMU mounting correction):
//   left / CCW turn -> yaw decreases
//   nose up         -> pitch increases

struct Radians {
  static const char* suffix() { return " rad"; }
};

struct Degrees {
  static const char* suffix() { return " deg"; }
};

static inline float deg2rad(float deg) { return deg * (float)M_PI / 180.0f; }
static inline float rad2deg(float rad) { return rad * 180.0f / (float)M_PI; }

// Wrap to (-pi, pi]. (float)M_PI itself maps to +pi.
static inline float wrapToPi(float a) {
  if (a > -(float)M_PI && a <= (float)M_PI) return a;

  const float twoPi = 2.0f * (float)M_PI;
  float w = fmodf(a + (float)M_PI, twoPi);
  if (w <= 0.0f) w += twoPi;
  w -= (float)M_PI;
  return (w <= -(float)M_PI) ? (float)M_PI : w;
}

static inline float wrapTo180(float deg) {
  return rad2deg(wrapToPi(deg2rad(deg)));
}

template <class Unit>
class Angle {
public:
  constexpr Angle() : v_(0.0f) {}
  constexpr explicit Angle(float v) : v_(v) {}

  constexpr float value() const { return v_; }

  Angle operator-() const { return Angle(-v_); }
  Angle operator+(Angle o) const { return Angle(v_ + o.v_); }
  Angle operator-(Angle o) const { return Angle(v_ - o.v_); }

  bool operator==(Angle o) const { return v_ == o.v_; }
  bool operator!=(Angle o) const { return v_ != o.v_; }
  bool operator< (Angle o) const { return v_ <  o.v_; }
  bool operator<=(Angle o) const { return v_ <= o.v_; }
  bool operator> (Angle o) const { return v_ >  o.v_; }
  bool operator>=(Angle o) const { return v_ >= o.v_; }

  Angle abs() const { return Angle(fabsf(v_)); }

  static const char* suffix() { return Unit::suffix(); }

private:
  float v_;
};

static inline Angle<Degrees> toDegrees(Angle<Radians> a) { return Angle<Degrees>(rad2deg(a.value())); }
static inline Angle<Radians> toRadians(Angle<Degrees> a) { return Angle<Radians>(deg2rad(a.value())); }

static inline Angle<Radians> normalized(Angle<Radians> a) { return Angle<Radians>(wrapToPi(a.value())); }
static inline Angle<Degrees> normalized(Angle<Degrees> a) { return Angle<Degrees>(wrapTo180(a.value())); }

// Signed shortest difference (a - b), wrapped.
template <class Unit>
static inline Angle<Unit> angleDiff(Angle<Unit> a, Angle<Unit> b) {
  return normalized(a - b);
}

// One orientation sample in radians.
struct YawPitchRoll {
  Angle<Radians> yaw;
  Angle<Radians> pitch;
  Angle<Radians> roll;

  YawPitchRoll inverted() const {
    YawPitchRoll r;
    r.yaw = -yaw;
    r.pitch = -pitch;
    r.roll = -roll;
    return r;
  }
};
