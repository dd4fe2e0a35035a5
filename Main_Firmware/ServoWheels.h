#pragma once
#include <Arduino.h>
#include <Servo.h>

#include "src/TrikeDrive.h"

// Continuous-rotation servo wheels: front, left, right.
// Only maps signed percent [-100, 100] onto the pulse width; no control here.
//   -100 -> minPulseUs, 0 -> neutral, +100 -> maxPulseUs (after reversal)
class ServoWheels : public WheelActuator {
public:
  struct Config {
    uint8_t pinFront = 9;
    uint8_t pinLeft  = 10;
    uint8_t pinRight = 11;

    uint16_t minPulseUs = 1000;
    uint16_t maxPulseUs = 2000;

    // Servos mounted mirrored spin the other way for the same pulse.
    bool reverseFront = false;
    bool reverseLeft  = true;
    bool reverseRight = false;
  };

  ServoWheels() = default;

  // Attach all three servos and park them at neutral.
  bool begin() { return begin(Config()); }

  bool begin(const Config& cfg) {
    cfg_ = cfg;
    if (cfg_.minPulseUs >= cfg_.maxPulseUs) return false;

    servos_[0].attach(cfg_.pinFront, cfg_.minPulseUs, cfg_.maxPulseUs);
    servos_[1].attach(cfg_.pinLeft,  cfg_.minPulseUs, cfg_.maxPulseUs);
    servos_[2].attach(cfg_.pinRight, cfg_.minPulseUs, cfg_.maxPulseUs);

    for (uint8_t i = 0; i < 3; i++) {
      if (!servos_[i].attached()) return false;
      servos_[i].writeMicroseconds(neutralUs_());
    }
    return true;
  }

  bool setDuty(Wheel wheel, int8_t signedPercent) override {
    const uint8_t i = (uint8_t)wheel;
    if (i >= 3 || !servos_[i].attached()) return false;

    int16_t pct = clamp_(signedPercent);
    if (reversed_(wheel)) pct = -pct;

    servos_[i].writeMicroseconds(pulseFor_(pct));
    return true;
  }

  // Neutral pulse on every wheel (servos hold still, still attached).
  void park() {
    for (uint8_t i = 0; i < 3; i++) {
      if (servos_[i].attached()) servos_[i].writeMicroseconds(neutralUs_());
    }
  }

private:
  static inline int16_t clamp_(int16_t x) {
    if (x > 100) return 100;
    if (x < -100) return -100;
    return x;
  }

  inline uint16_t neutralUs_() const {
    return (uint16_t)((cfg_.minPulseUs + cfg_.maxPulseUs) / 2);
  }

  inline uint16_t pulseFor_(int16_t pct) const {
    const int32_t half = (int32_t)(cfg_.maxPulseUs - cfg_.minPulseUs) / 2;
    return (uint16_t)((int32_t)neutralUs_() + half * pct / 100);
  }

  inline bool reversed_(Wheel w) const {
    switch (w) {
      case Wheel::Front: return cfg_.reverseFront;
      case Wheel::Left:  return cfg_.reverseLeft;
      case Wheel::Right: return cfg_.reverseRight;
    }
    return false;
  }

  Config cfg_;
  Servo servos_[3];
};
