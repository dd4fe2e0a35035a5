#ifndef HEADINGPID_H
#define HEADINGPID_H

#include <math.h>

/*
  HeadingPID.h  (header-only)

  - PID on a heading error that is already wrapped by the caller (degrees):
      u = Kp*e + Ki*∫e dt + Kd*de/dt
  - Output clamp (default ±25, the veer-percentage budget on top of the base offset)
  - Integral clamp (anti-windup)
  - Optional first-order low-pass on the D term (tau, seconds; 0 = off)
  - Ki = Kd = 0 gives the plain proportional controller used by default.

  The D term works on the error, not on a measurement: the heading setpoint only
  changes when the mission captures a new reference, and reset() is called then.
*/

class HeadingPID {
public:
  HeadingPID() = default;

  HeadingPID(float kp, float ki, float kd, float dt_s) {
    setGains(kp, ki, kd);
    setDt(dt_s);
  }

  inline void setGains(float kp, float ki, float kd) {
    kp_ = kp;
    ki_ = ki;
    kd_ = kd;
  }

  inline void setDt(float dt_s) {
    dt_ = (dt_s > 1e-6f) ? dt_s : 1e-6f;
    updateFilterCoeff_();
  }

  inline float getDt() const { return dt_; }

  // Symmetric clamp on the output.
  inline void setOutputLimit(float absLimit) {
    outAbs_ = fabsf(absLimit);
  }

  inline void setIntegralLimit(float absLimit) {
    iAbs_ = fabsf(absLimit);
  }

  inline void setDerivativeFilterTau(float tau_s) {
    tau_ = (tau_s > 0.0f) ? tau_s : 0.0f;
    updateFilterCoeff_();
  }

  inline void reset() {
    integ_ = 0.0f;
    prevErr_ = 0.0f;
    dFilt_ = 0.0f;
    initialized_ = false;
  }

  inline float update(float errDeg) {
    if (!initialized_) {
      // no derivative kick on the first sample
      prevErr_ = errDeg;
      dFilt_ = 0.0f;
      initialized_ = true;
    }

    integ_ = clamp_(integ_ + errDeg * dt_, iAbs_);

    const float derivRaw = (errDeg - prevErr_) / dt_;
    dFilt_ = (tau_ > 0.0f) ? (a_ * dFilt_ + (1.0f - a_) * derivRaw) : derivRaw;

    prevErr_ = errDeg;

    return clamp_(kp_ * errDeg + ki_ * integ_ + kd_ * dFilt_, outAbs_);
  }

  inline float integral() const { return integ_; }

private:
  static inline float clamp_(float x, float lim) {
    if (x > lim) return lim;
    if (x < -lim) return -lim;
    return x;
  }

  inline void updateFilterCoeff_() {
    a_ = (tau_ > 0.0f) ? (tau_ / (tau_ + dt_)) : 0.0f;
  }

  float kp_ = 1.0f;
  float ki_ = 0.0f;
  float kd_ = 0.0f;

  float dt_ = 0.02f;

  float outAbs_ = 25.0f;
  float iAbs_   = 50.0f;

  float integ_ = 0.0f;
  float prevErr_ = 0.0f;

  float tau_ = 0.0f;
  float a_ = 0.0f;
  float dFilt_ = 0.0f;

  bool initialized_ = false;
};

#endif // HEADINGPID_H
