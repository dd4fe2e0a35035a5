#pragma once
#include <Arduino.h>
#include <Wire.h>
#include <VL53L1X.h>

// VL53L1X time-of-flight range sensor, continuous mode, non-blocking read.
//
//   begin(): init with retries, long distance mode, narrowed ROI, start continuous
//   read():  true only when a fresh, valid sample was taken this call
//            false = "no new data this tick" (caller keeps its previous value)
class RangeTof {
public:
  struct Config {
    uint16_t ioTimeoutMs       = 100;   // per I2C transaction
    uint8_t  initRetries       = 10;
    uint16_t initRetryDelayMs  = 100;
    uint32_t timingBudgetUs    = 100000;
    uint16_t interMeasurementMs = 200;
    // Region of interest (SPADs). 16x16 is the full array; a narrower beam
    // sees less of the floor while scanning.
    uint8_t  roiWidth  = 5;
    uint8_t  roiHeight = 5;
  };

  RangeTof() = default;

  bool begin() { return begin(Config()); }

  bool begin(const Config& cfg) {
    cfg_ = cfg;

    tof_.setBus(&Wire);
    tof_.setTimeout(cfg_.ioTimeoutMs);

    uint8_t attempt = 0;
    while (!tof_.init()) {
      Serial.println("VL53L1X init failed, retrying");
      if (++attempt >= cfg_.initRetries) return false;
      delay(cfg_.initRetryDelayMs);
    }

    if (!tof_.setDistanceMode(VL53L1X::Long)) return false;
    if (!tof_.setMeasurementTimingBudget(cfg_.timingBudgetUs)) return false;
    tof_.setROISize(cfg_.roiWidth, cfg_.roiHeight);

    tof_.startContinuous(cfg_.interMeasurementMs);
    started_ = true;
    return true;
  }

  bool read(int32_t* outMm) {
    if (!started_ || !tof_.dataReady()) return false;

    const uint16_t mm = tof_.read(false);
    if (tof_.timeoutOccurred()) {
      timeouts_++;
      return false;
    }
    if (tof_.ranging_data.range_status != VL53L1X::RangeValid) {
      invalid_++;
      return false;
    }

    lastMm_ = (int32_t)mm;
    if (outMm) *outMm = lastMm_;
    return true;
  }

  int32_t lastMm() const { return lastMm_; }
  uint16_t timeouts() const { return timeouts_; }
  uint16_t invalidSamples() const { return invalid_; }

private:
  VL53L1X tof_;
  Config cfg_;
  bool started_ = false;

  int32_t lastMm_ = 0;
  uint16_t timeouts_ = 0;
  uint16_t invalid_ = 0;
};
