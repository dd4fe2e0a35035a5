#pragma once
#include <Arduino.h>
#include <avr/interrupt.h>

// Critical section for state shared with an ISR: save SREG, cli(), restore on scope exit.
// Safe to nest and safe inside an ISR (interrupts are already off there).
struct IrqGuard {
  IrqGuard() : sreg_(SREG) { cli(); }
  ~IrqGuard() { SREG = sreg_; }

  IrqGuard(const IrqGuard&) = delete;
  IrqGuard& operator=(const IrqGuard&) = delete;

private:
  uint8_t sreg_;
};
