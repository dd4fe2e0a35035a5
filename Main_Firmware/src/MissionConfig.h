#pragma once
#include <stdint.h>

enum class MissionPhase : uint8_t {
  WaitForStart = 0,
  ApproachObstacle,
  ClimbUp,
  ClimbOver,
  ClimbDown,
  ScanForTarget,
  ApproachTarget
};

static const uint8_t MISSION_PHASE_COUNT = 7;

const char* phaseName(MissionPhase p);

// ----- Climb table -----
// One row per pitch-gated phase (ApproachObstacle..ClimbDown).
enum class PitchGuard : uint8_t { AtLeast, AtMost };

struct ClimbStep {
  MissionPhase phase;
  PitchGuard   guard;
  float        pitchDeg;     // threshold
  uint16_t     debounceMs;   // 0 = transition on the first guard-true tick
  uint8_t      speed;        // 0..100
  bool         holdHeading;  // driveStraight() on the reference yaw instead of plain Forward
  MissionPhase next;
};

static const uint8_t CLIMB_STEP_COUNT = 4;

// Which deviations from the captured target reference count as contact.
enum class ContactGuards : uint8_t {
  PitchOnly,
  PitchAndRoll
};

struct MissionConfig {
  // Loads the course table the robot ran with.
  MissionConfig();

  ClimbStep climb[CLIMB_STEP_COUNT];

  // What the start button requests.
  MissionPhase startPhase = MissionPhase::ApproachObstacle;

  // ----- ScanForTarget -----
  uint8_t scanSpeed        = 12;
  float   maxScanDeg       = 70.0f;
  int32_t anomalyBufferMm  = 250;

  // ----- ApproachTarget -----
  uint8_t  approachSpeed     = 60;
  int32_t  contactRangeMm    = 60;
  uint16_t contactDebounceMs = 100;

  ContactGuards contactGuards = ContactGuards::PitchAndRoll;
  float    pitchMarginDeg   = 4.0f;
  uint16_t pitchDebounceMs  = 150;
  float    rollMarginDeg    = 4.0f;
  uint16_t rollDebounceMs   = 150;

  // Returns the row for a pitch-gated phase, or nullptr.
  const ClimbStep* stepFor(MissionPhase p) const;
};
