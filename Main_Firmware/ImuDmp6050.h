// ImuDmp6050.h
#pragma once
#include <Arduino.h>
#include <Wire.h>
#include <I2Cdev.h>
#include <MPU6050_6Axis_MotionApps20.h>

#include "src/Angle.h"

// MPU-6050 orientation via the on-chip DMP (yaw/pitch/roll fusion).
// MotionApps20 defines its DMP image in the header: include this file from
// exactly one sketch translation unit.
//
// Readings are returned relative to the pose captured by zero(), wrapped to
// (-pi, pi]. Mounting sign correction is left to the caller.
class ImuDmp6050 {
public:
  struct Config {
    uint32_t i2cClockHz  = 400000;
    uint8_t  calibLoops  = 6;       // CalibrateAccel/Gyro iterations (100 samples each)
    uint32_t zeroHoldMs  = 20000;   // keep still while the DMP settles, then take the offset
  };

  ImuDmp6050() = default;

  // 1) Wire + MPU init, DMP load, accel/gyro offset calibration
  bool begin() { return begin(Config()); }
  bool begin(const Config& cfg);

  // 2) Zero yaw/pitch/roll at the current pose. Blocks for zeroHoldMs.
  bool zero();

  // 3) One sample if the DMP FIFO has a complete packet. false = no new data.
  bool read(YawPitchRoll* out);

private:
  bool readRaw_(YawPitchRoll* out);

  static inline Angle<Radians> offset_(float raw, Angle<Radians> off) {
    return Angle<Radians>(wrapToPi(raw - off.value()));
  }

  MPU6050 mpu_;
  Config  cfg_;

  uint8_t fifo_[64];

  // bit0: dmp ready, bit1: zeroed
  uint8_t state_ = 0;

  YawPitchRoll zero_;
};

// ------------------------------------------------------------

inline bool ImuDmp6050::begin(const Config& cfg) {
  cfg_ = cfg;
  state_ = 0;

  Wire.begin();
  Wire.setClock(cfg_.i2cClockHz);

  mpu_.initialize();
  if (!mpu_.testConnection()) return false;

  // 0 = success, 1 = memory load failed, 2 = DMP config update failed
  if (mpu_.dmpInitialize() != 0) return false;

  mpu_.CalibrateAccel(cfg_.calibLoops);
  mpu_.CalibrateGyro(cfg_.calibLoops);
  mpu_.setDMPEnabled(true);

  state_ = 0x01;
  return true;
}

inline bool ImuDmp6050::zero() {
  if (!(state_ & 0x01)) return false;

  // Drain samples while the fusion settles; the last one becomes the zero pose.
  YawPitchRoll last;
  bool have = false;
  const uint32_t t0 = millis();
  while ((uint32_t)(millis() - t0) < cfg_.zeroHoldMs) {
    if (readRaw_(&last)) have = true;
  }
  if (!have) return false;

  zero_ = last;
  state_ |= 0x02;
  return true;
}

inline bool ImuDmp6050::read(YawPitchRoll* out) {
  YawPitchRoll raw;
  if (!readRaw_(&raw)) return false;

  if (out) {
    out->yaw   = offset_(raw.yaw.value(),   zero_.yaw);
    out->pitch = offset_(raw.pitch.value(), zero_.pitch);
    out->roll  = offset_(raw.roll.value(),  zero_.roll);
  }
  return true;
}

inline bool ImuDmp6050::readRaw_(YawPitchRoll* out) {
  if (!(state_ & 0x01)) return false;
  if (!mpu_.dmpGetCurrentFIFOPacket(fifo_)) return false;

  Quaternion q;
  VectorFloat gravity;
  float ypr[3];
  mpu_.dmpGetQuaternion(&q, fifo_);
  mpu_.dmpGetGravity(&gravity, &q);
  mpu_.dmpGetYawPitchRoll(ypr, &q, &gravity);

  out->yaw   = Angle<Radians>(ypr[0]);
  out->pitch = Angle<Radians>(ypr[1]);
  out->roll  = Angle<Radians>(ypr[2]);
  return true;
}
